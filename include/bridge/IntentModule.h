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

#include <memory>
#include <optional>
#include <string>

#include "bridge/BridgeContext.h"
#include "bridge/Intent.h"
#include "bridge/IntentExtra.h"
#include "bridge/Promise.h"

namespace bridge {

class InitialUrlResolver;

/**
 * IntentModule: launch other activities or open urls on behalf of the runtime.
 * Every operation answers through its promise, errors are rejected with
 * binder::Status::EX_ILLEGAL_ARGUMENT and a readable message.
 */
class IntentModule {
public:
    explicit IntentModule(const std::shared_ptr<BridgeContext>& context);
    ~IntentModule();

    static inline const char* name() {
        return "IntentBridge";
    }

    /**
     * Resolve with the url the activity was started with, or null.
     * The promise is parked until the host resumes when there is no activity yet.
     */
    void getInitialURL(const PromisePtr& promise);
    /** Start the activity which handles the url. Resolve with true. */
    void openURL(const std::optional<std::string>& url, const PromisePtr& promise);
    /** Resolve with whether an installed activity can handle the url. */
    void canOpenURL(const std::optional<std::string>& url, const PromisePtr& promise);
    /** Open the settings page of this package. Resolve with true. */
    void openSettings(const PromisePtr& promise);
    /**
     * Start an activity for the action, e.g. action = "action.settings.CHANNEL_NOTIFICATION"
     * and extras = [{"extra.APP_PACKAGE": "my.package"}, {"extra.CHANNEL_ID": "my.channel"}]
     * Resolve with true.
     */
    void sendIntent(const std::string& action, const std::optional<IntentExtras>& extras,
                    const PromisePtr& promise);

    /** The module is going away: parked promises are dropped without an answer. */
    void invalidate();

    /** "Idle" or "Armed(<pending>)", invalidated modules are "Invalidated" */
    std::string getInitialUrlState();

private:
    bool lookupInitialUrl(const PromisePtr& promise);
    android::status_t sendOSIntent(Intent& intent, bool useNewTaskFlag);

private:
    std::shared_ptr<BridgeContext> mContext;
    std::shared_ptr<InitialUrlResolver> mInitialUrlResolver;
};

} // namespace bridge
