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

#include "zvm_utils.hpp"

#include <ctype.h>
#include <errno.h>
#include <iomanip>
#include <openssl/evp.h>
#include <sstream>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

namespace ZVM {

uint64_t _blk_size_rounding(uint64_t size_bytes, uint64_t block_size) {
    uint64_t mask = block_size - 1;

    if (size_bytes > UINT64_MAX - mask) {
        return 0;
    }
    return (size_bytes + mask) & ~mask;
}

std::string _md5(const std::string &data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    char out_hash[_MD5_HASH_STR_LEN];

    memset(out_hash, 0, sizeof(out_hash));

    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_md5(),
                   NULL) != 1) {
        return std::string();
    }

    for (unsigned int i = 0; i < digest_len && (i * 2 + 2) < sizeof(out_hash);
         ++i) {
        snprintf(&out_hash[i * 2], 3, "%02x", digest[i]);
    }
    return std::string(out_hash);
}

std::string _volume_serial(const std::string &volume_id) {
    return _md5(volume_id).substr(0, _SERIAL_LEN);
}

uint64_t _time_now(void) { return (uint64_t)time(NULL); }

bool _size_parse(const std::string &s, uint64_t *size) {
    const char *str = s.c_str();
    char *end = NULL;
    uint64_t mult = 1;

    if (size == NULL || s.empty() || !isdigit((unsigned char)str[0])) {
        return false;
    }

    errno = 0;
    unsigned long long num = strtoull(str, &end, 10);
    if (errno != 0) {
        return false;
    }

    std::string units(end);
    if (units.size() > 1) {
        return false;
    }

    if (units.size() == 1) {
        switch (toupper((unsigned char)units[0])) {
        case 'B':
            break;
        case 'K':
            mult = 1024;
            break;
        case 'M':
            mult = MiB;
            break;
        case 'G':
            mult = GiB;
            break;
        case 'T':
            mult = TiB;
            break;
        default:
            return false;
        }
    }

    if (num > UINT64_MAX / mult) {
        return false;
    }

    *size = (uint64_t)num * mult;
    return true;
}

std::string _size_human(bool human, uint64_t size) {
    std::string units = "";
    double s = size;

    if (human) {
        if (size >= TiB) {
            units = " TiB";
            s /= (double)TiB;
        } else if (size >= GiB) {
            units = " GiB";
            s /= (double)GiB;
        } else if (size >= MiB) {
            units = " MiB";
            s /= (double)MiB;
        }
    }

    std::ostringstream o;
    if (human && (size >= MiB)) {
        o << std::setiosflags(std::ios::fixed) << std::setprecision(2) << s;
    } else {
        o << size;
    }

    return o.str() + units;
}

std::vector<std::string> _split_lines(const std::string &out) {
    std::vector<std::string> rc;
    std::istringstream in(out);
    std::string line;

    while (std::getline(in, line)) {
        line = _trim_spaces(line);
        if (!line.empty()) {
            rc.push_back(line);
        }
    }
    return rc;
}

std::string _trim_spaces(const std::string &s) {
    size_t b = 0;
    size_t e = s.size();

    while (b < e && isspace((unsigned char)s[b])) {
        ++b;
    }
    while (e > b && isspace((unsigned char)s[e - 1])) {
        --e;
    }
    return s.substr(b, e - b);
}

bool _str_icontains(const std::string &haystack, const std::string &needle) {
    std::string h(haystack);
    std::string n(needle);

    for (size_t i = 0; i < h.size(); ++i) {
        h[i] = tolower((unsigned char)h[i]);
    }
    for (size_t i = 0; i < n.size(); ++i) {
        n[i] = tolower((unsigned char)n[i]);
    }
    return h.find(n) != std::string::npos;
}

} // namespace ZVM
