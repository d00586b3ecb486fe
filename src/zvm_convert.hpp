/*
 * Copyright (C) 2011-2014 Red Hat, Inc.
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef ZVM_CONVERT_HPP
#define ZVM_CONVERT_HPP

#include "zvm_datatypes.hpp"
#include "zvm_ipc.hpp"

namespace ZVM {

/**
 * Class names for serialized json
 */
const char CLASS_NAME_VOLUME[] = "Volume";
const char CLASS_NAME_SNAPSHOT[] = "Snapshot";
const char CLASS_NAME_EXPORT[] = "Export";
const char CLASS_NAME_RECONCILE_REPORT[] = "ReconcileReport";

#define IS_CLASS(x, name) is_expected_object(x, name)

#define IS_CLASS_VOLUME(x)   IS_CLASS(x, CLASS_NAME_VOLUME)
#define IS_CLASS_SNAPSHOT(x) IS_CLASS(x, CLASS_NAME_SNAPSHOT)
#define IS_CLASS_EXPORT(x)   IS_CLASS(x, CLASS_NAME_EXPORT)

/**
 * Checks to see if a value is an expected object instance
 * @param obj           Value to check
 * @param class_name    Class name to check
 * @return boolean, true if matches
 */
ZVM_DLL_LOCAL bool is_expected_object(Value &obj,
                                      const std::string &class_name);

/**
 * Converts a Value to a Volume, ValueException if it is not one.
 * @param vol   Value to convert
 * @return Volume
 */
ZVM_DLL_LOCAL Volume value_to_volume(Value &vol);

/**
 * Converts a Volume to a Value
 * @param vol   Volume to convert
 * @return Value
 */
ZVM_DLL_LOCAL Value volume_to_value(const Volume &vol);

ZVM_DLL_LOCAL Snapshot value_to_snapshot(Value &snap);
ZVM_DLL_LOCAL Value snapshot_to_value(const Snapshot &snap);

ZVM_DLL_LOCAL Export value_to_export(Value &exp);
ZVM_DLL_LOCAL Value export_to_value(const Export &exp);

ZVM_DLL_LOCAL ReconcileReport value_to_report(Value &report);
ZVM_DLL_LOCAL Value report_to_value(const ReconcileReport &report);

/**
 * Converts an array of Values to a vector of strings
 * @param list  Value of array type
 * @return vector of strings, ValueException on a non string member
 */
ZVM_DLL_LOCAL std::vector<std::string> value_to_string_list(Value &list);

/**
 * Converts a vector of strings to an array Value
 * @param sl    Strings to convert
 * @return Value
 */
ZVM_DLL_LOCAL Value string_list_to_value(const std::vector<std::string> &sl);

} // namespace ZVM

#endif
