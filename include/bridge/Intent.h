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

#include <binder/Parcel.h>
#include <binder/PersistableBundle.h>
#include <binder/Status.h>

#include <string>
#include <vector>

namespace bridge {

/**
 * Intent: the description of an operation to be performed by the system,
 * e.g. "view this uri" or "open the details page of this package".
 */
class Intent : public android::Parcelable {
public:
    std::string mTarget;
    std::string mAction;
    std::string mData;
    uint32_t mFlag;
    std::vector<std::string> mCategories;
    /** PersistableBundle,a mapping from String values to various types */
    android::os::PersistableBundle mExtra;

    enum {
        NO_FLAG = 0,
        FLAG_ACTIVITY_NEW_TASK = 1,
        FLAG_ACTIVITY_SINGLE_TOP = 2,
        FLAG_ACTIVITY_CLEAR_TOP = 4,
        FLAG_ACTIVITY_CLEAR_TASK = 8,
        FLAG_ACTIVITY_NO_HISTORY = 16,
        FLAG_ACTIVITY_EXCLUDE_FROM_RECENTS = 32,
    };

    Intent() : mFlag(NO_FLAG){};
    ~Intent() = default;

    Intent(const std::string& action, const std::string& data)
          : mAction(action), mData(data), mFlag(NO_FLAG) {}

    void setTarget(const std::string& target);
    void setAction(const std::string& action);
    void setData(const std::string& data);
    void setFlag(const uint32_t flag);
    void addFlags(const uint32_t flags);
    bool hasFlag(const uint32_t flag) const;
    void addCategory(const std::string& category);
    bool hasCategory(const std::string& category) const;

    /** "package/Activity" -> "package", empty when it is not a component name */
    static std::string getPackageOf(const std::string& component);
    std::string getTargetPackage() const;
    std::string toString() const;

    android::status_t readFromParcel(const android::Parcel* parcel) final;
    android::status_t writeToParcel(android::Parcel* parcel) const final;

public:
    /****************** action definition *****************/
    static const std::string ACTION_VIEW;
    static const std::string ACTION_NDEF_DISCOVERED;
    static const std::string ACTION_APPLICATION_DETAILS_SETTINGS;
    /******************************************************/

    /***************** category definition ****************/
    static const std::string CATEGORY_DEFAULT;
    /******************************************************/
}; // class Intent

} // namespace bridge
