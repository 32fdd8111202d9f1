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

#define LOG_TAG "PackageIntentResolver"

#include "PackageIntentResolver.h"

#include <pm/PackageManager.h>

#include <vector>

#include "bridge/Logger.h"

namespace bridge {

using os::pm::PackageInfo;
using os::pm::PackageManager;

bool PackageIntentResolver::resolveActivity(const Intent& intent, std::string* component) {
    PackageManager pm;
    std::vector<PackageInfo> allPackages;
    if (0 != pm.getAllPackageInfo(&allPackages)) {
        ALOGE("PackageManager getAllPackageInfo failure");
        return false;
    }

    const std::string targetPackage = intent.getTargetPackage();
    for (auto& packageInfo : allPackages) {
        for (auto& activity : packageInfo.activitiesInfo) {
            const std::string name = COMPONENT_NAME_SPLICE(packageInfo.packageName, activity.name);
            if (!targetPackage.empty()) {
                if (name == intent.mTarget) {
                    *component = name;
                    return true;
                }
                continue;
            }
            if (intent.mAction.empty()) {
                continue;
            }
            for (auto& a : activity.actions) {
                if (a == intent.mAction) {
                    *component = name;
                    return true;
                }
            }
        }
    }

    ALOGD("no activity for %s", intent.toString().c_str());
    return false;
}

} // namespace bridge
