/*
 * Copyright (C) 2023 Xiaomi Corporation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "bridge/Uri.h"

#include <ctype.h>

namespace bridge {

using android::BAD_VALUE;
using android::OK;
using android::status_t;

// RFC 3986: scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
static bool isValidScheme(const std::string& scheme) {
    if (scheme.empty() || !isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    for (const char c : scheme) {
        if (!isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

status_t Uri::parse(const std::string& str, Uri* uri) {
    if (str.empty()) {
        return BAD_VALUE;
    }
    for (const char c : str) {
        const auto uc = static_cast<unsigned char>(c);
        if (iscntrl(uc) || isspace(uc)) {
            return BAD_VALUE;
        }
    }

    // The scheme ends at the first ':' unless a path, query or fragment starts earlier
    const auto colon = str.find(':');
    const auto delimiter = str.find_first_of("/?#");
    if (colon == std::string::npos || (delimiter != std::string::npos && delimiter < colon)) {
        return BAD_VALUE;
    }

    const std::string scheme = str.substr(0, colon);
    if (!isValidScheme(scheme)) {
        return BAD_VALUE;
    }
    *uri = Uri(scheme, str.substr(colon + 1));
    return OK;
}

Uri Uri::normalizeScheme() const {
    std::string scheme(mScheme);
    for (auto& c : scheme) {
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    return Uri(scheme, mSchemeSpecificPart);
}

std::string Uri::toString() const {
    if (mScheme.empty()) {
        return mSchemeSpecificPart;
    }
    return mScheme + ":" + mSchemeSpecificPart;
}

} // namespace bridge
