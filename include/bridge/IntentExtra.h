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

#include <string>
#include <vector>

namespace bridge {

/**
 * A dynamically typed extra value as it arrives from the calling runtime.
 * Only boolean, number and string values can be put into an Intent.
 */
class ExtraValue {
public:
    enum Type {
        TYPE_NULL = 0,
        TYPE_BOOLEAN,
        TYPE_NUMBER,
        TYPE_STRING,
        TYPE_MAP,
        TYPE_ARRAY,
    };

    ExtraValue() : mType(TYPE_NULL), mBoolean(false), mNumber(0) {}

    static ExtraValue ofBoolean(bool value) {
        ExtraValue v(TYPE_BOOLEAN);
        v.mBoolean = value;
        return v;
    }
    static ExtraValue ofNumber(double value) {
        ExtraValue v(TYPE_NUMBER);
        v.mNumber = value;
        return v;
    }
    static ExtraValue ofString(const std::string& value) {
        ExtraValue v(TYPE_STRING);
        v.mString = value;
        return v;
    }
    static ExtraValue ofMap() {
        return ExtraValue(TYPE_MAP);
    }
    static ExtraValue ofArray() {
        return ExtraValue(TYPE_ARRAY);
    }

    Type getType() const {
        return mType;
    }
    bool getBoolean() const {
        return mBoolean;
    }
    double getNumber() const {
        return mNumber;
    }
    const std::string& getString() const {
        return mString;
    }

private:
    explicit ExtraValue(Type type) : mType(type), mBoolean(false), mNumber(0) {}

    Type mType;
    bool mBoolean;
    double mNumber;
    std::string mString;
};

struct IntentExtra {
    std::string key;
    ExtraValue value;

    IntentExtra(const std::string& k, const ExtraValue& v) : key(k), value(v) {}
};

using IntentExtras = std::vector<IntentExtra>;

} // namespace bridge
