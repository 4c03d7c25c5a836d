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

using Op = Operator<double>;

void exportOperator(py::module& m)
{
    py::class_<Shape>(m, "Shape")
        .def(py::init<Index, Index>())
        .def_readonly("codim", &Shape::codim)
        .def_readonly("dim", &Shape::dim)
        .def("__repr__", &Shape::str);

    py::class_<Op>(m, "Operator")
        .def_property_readonly("shape", &Op::shape)
        .def_property_readonly("name", &Op::name)
        .def_property_readonly("properties", &Op::properties)
        .def("has", &Op::has)
        .def("apply", &Op::apply)
        .def("__call__", &Op::apply)
        .def("adjoint", &Op::adjoint)
        .def("jacobian", &Op::jacobian)
        .def("gradient", &Op::gradient)
        .def("prox", &Op::prox, py::arg("x"), py::arg("tau"))
        .def("lipschitz", &Op::lipschitz_estimate)
        .def("diff_lipschitz", &Op::diff_lipschitz_estimate)
        .def("describe", [](const Op& op) { return describe(op); })
        .def("__add__", [](const Op& a, const Op& b) { return a + b; })
        .def("__sub__", [](const Op& a, const Op& b) { return a - b; })
        .def("__neg__", [](const Op& a) { return -a; })
        .def("__mul__", [](const Op& a, const Op& b) { return a * b; })
        .def("__mul__", [](const Op& a, double c) { return a * c; })
        .def("__rmul__", [](const Op& a, double c) { return c * a; })
        .def("__pow__", [](const Op& a, int k) { return power(a, k); })
        .def_property_readonly("T", [](const Op& a) { return transpose(a); })
        .def("__repr__", [](const Op& op) { return "<Operator " + op.name() + " " + op.shape().str() + ">"; });
}
