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

#pragma once

#include <utils/Errors.h>

#include <string>

namespace bridge {

/**
 * Uri: an immutable uri reference, "scheme:scheme-specific-part".
 * Only the scheme is interpreted, the rest is kept as written.
 */
class Uri {
public:
    Uri() = default;
    ~Uri() = default;

    /**
     * Parse a uri reference. Returns BAD_VALUE when the string is empty,
     * contains whitespace or control characters, or has no valid scheme.
     */
    static android::status_t parse(const std::string& str, Uri* uri);

    const std::string& getScheme() const {
        return mScheme;
    }
    const std::string& getSchemeSpecificPart() const {
        return mSchemeSpecificPart;
    }

    /** the scheme is converted to lower case, e.g. "HTTP://host/Path" -> "http://host/Path" */
    Uri normalizeScheme() const;
    std::string toString() const;

private:
    Uri(const std::string& scheme, const std::string& ssp)
          : mScheme(scheme), mSchemeSpecificPart(ssp) {}

    std::string mScheme;
    std::string mSchemeSpecificPart;
};

} // namespace bridge
