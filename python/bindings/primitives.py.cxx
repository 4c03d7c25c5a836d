//                    _
//   ___  _ __   __ _| | __ _
//  / _ \| '_ \ / _` | |/ _` |
// | (_) | |_) | (_| | | (_| |
//  \___/| .__/ \__,_|_|\__, |
//       |_|            |___/
//
// operator algebra made easier in C++
//
// Licensed under the MIT License <http://opensource.org/licenses/MIT>.
//
// Copyright © 2025–2025
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

// pybind11 includes
#include "pybind11.hxx"

using namespace opalg;

void exportPrimitives(py::module& m)
{
    m.def("IdentityOp", &IdentityOp<double>, py::arg("dim") = AGNOSTIC_DIM);
    m.def("HomothetyOp", &HomothetyOp<double>, py::arg("a"), py::arg("dim") = AGNOSTIC_DIM);
    m.def("NullOp", &NullOp<double>, py::arg("codim"), py::arg("dim"));
    m.def("NullFunc", &NullFunc<double>, py::arg("dim"));
    m.def("DiagonalOp", &DiagonalOp<double>, py::arg("d"));
    m.def("ExplicitLinOp", &ExplicitLinOp<double>, py::arg("A"));
    m.def("LinFunc", &LinFunc<double>, py::arg("c"));
    m.def("L1Norm", &L1Norm<double>, py::arg("dim") = AGNOSTIC_DIM);
    m.def("L2Norm", &L2Norm<double>, py::arg("dim") = AGNOSTIC_DIM);
    m.def("L21Norm", &L21Norm<double>, py::arg("group_size"), py::arg("groups") = AGNOSTIC_DIM);
    m.def("SquaredL2Norm", &SquaredL2Norm<double>, py::arg("dim") = AGNOSTIC_DIM);
    m.def("SquaredL1Norm", &SquaredL1Norm<double>, py::arg("dim") = AGNOSTIC_DIM);
    m.def("LInfinityNorm", &LInfinityNorm<double>, py::arg("dim") = AGNOSTIC_DIM);
}
