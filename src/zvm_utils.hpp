/*
 * Copyright (C) 2016 Red Hat, Inc.
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
#ifndef _ZVM_UTILS_HPP_
#define _ZVM_UTILS_HPP_

#include "libzvolmgmt/libzvolmgmt_common.h"

#include <stdint.h>
#include <string>
#include <vector>

namespace ZVM {

#define _MD5_HASH_STR_LEN 33
#define _SERIAL_LEN       16

const uint64_t MiB = 1048576;       // 2**20
const uint64_t GiB = 1073741824;    // 2**30
const uint64_t TiB = 1099511627776; // 2**40

/*
 * Round size_bytes up to a multiple of block_size.  block_size must be
 * a power of two.  Returns 0 on overflow.
 */
ZVM_DLL_LOCAL uint64_t _blk_size_rounding(uint64_t size_bytes,
                                          uint64_t block_size);

/*
 * Hex encoded md5 of data.
 */
ZVM_DLL_LOCAL std::string _md5(const std::string &data);

/*
 * SCSI unit serial number for a volume: first _SERIAL_LEN digits of the
 * md5 of its id, stable for the life of the id.
 */
ZVM_DLL_LOCAL std::string _volume_serial(const std::string &volume_id);

/*
 * Seconds since epoch.
 */
ZVM_DLL_LOCAL uint64_t _time_now(void);

/*
 * Parse "<num>", "<num>B" or "<num>[KMGT]" (binary multiples) into bytes.
 * Returns false on syntax error or overflow.
 */
ZVM_DLL_LOCAL bool _size_parse(const std::string &s, uint64_t *size);

/*
 * Returns a string representation of a size, optionally scaled to
 * MiB/GiB/TiB with two decimals.
 */
ZVM_DLL_LOCAL std::string _size_human(bool human, uint64_t size);

/*
 * Split command output into lines, dropping empty ones.
 */
ZVM_DLL_LOCAL std::vector<std::string> _split_lines(const std::string &out);

/*
 * Strip leading and trailing white space.
 */
ZVM_DLL_LOCAL std::string _trim_spaces(const std::string &s);

/*
 * true if haystack contains needle, ignoring ASCII case.
 */
ZVM_DLL_LOCAL bool _str_icontains(const std::string &haystack,
                                  const std::string &needle);

} // namespace ZVM

#endif /* End of _ZVM_UTILS_HPP_ */
