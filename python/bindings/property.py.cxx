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

void exportProperty(py::module& m)
{
    auto property = py::enum_<Property>(m, "Property");
    for(std::size_t i = 0; i < PROPERTY_COUNT; ++i) {
        const auto p = static_cast<Property>(i);
        property.value(to_string(p), p);
    }

    py::enum_<LipschitzMethod>(m, "LipschitzMethod")
        .value("Frobenius", LipschitzMethod::Frobenius)
        .value("PowerIteration", LipschitzMethod::PowerIteration);

    py::class_<PropertySet>(m, "PropertySet")
        .def(py::init<>())
        .def("has", &PropertySet::has)
        .def("contains", &PropertySet::contains)
        .def("to_list", &PropertySet::to_vector)
        .def("__len__", &PropertySet::size)
        .def("__contains__", &PropertySet::has)
        .def("__repr__", &PropertySet::str)
        .def(py::self == py::self);

    py::class_<RuntimeConfig>(m, "RuntimeConfig")
        .def(py::init<>())
        .def_readwrite("lipschitz_method", &RuntimeConfig::lipschitz_method)
        .def_readwrite("max_power_iterations", &RuntimeConfig::max_power_iterations)
        .def_readwrite("power_tolerance", &RuntimeConfig::power_tolerance)
        .def_readwrite("power_safety_margin", &RuntimeConfig::power_safety_margin)
        .def_readwrite("seed", &RuntimeConfig::seed);

    m.def("set_config", &ConfigManager::set_current);
    m.def("reset_config", &ConfigManager::reset);
}
