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

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "bridge/BridgeContext.h"
#include "bridge/UvLoop.h"

namespace bridge {

using std::string;

/**
 * HostContext: the BridgeContext of an embedding host.
 * The host reports its surface lifecycle through onHostResume/onHostPause/onHostDestroy,
 * the events are delivered to the listeners on the host's main loop.
 */
class HostContext : public BridgeContext {
public:
    using ActivityStarter = std::function<android::status_t(const Intent& intent)>;

    HostContext(const string& packageName, UvLoop* loop, const ActivityStarter& starter,
                const std::shared_ptr<IntentResolver>& resolver);
    ~HostContext() = default;

    static std::shared_ptr<HostContext> create(const string& packageName, UvLoop* loop,
                                               const ActivityStarter& starter,
                                               const std::shared_ptr<IntentResolver>& resolver);

    const string& getPackageName() const override;
    std::shared_ptr<Activity> getCurrentActivity() override;
    std::shared_ptr<IntentResolver> getIntentResolver() override;
    android::status_t startActivity(const Intent& intent) override;

    void addLifecycleEventListener(
            const std::shared_ptr<LifecycleEventListener>& listener) override;
    void removeLifecycleEventListener(
            const std::shared_ptr<LifecycleEventListener>& listener) override;

    void onHostResume(const std::shared_ptr<Activity>& activity);
    void onHostPause();
    void onHostDestroy();

    size_t getLifecycleEventListenerCount();

    enum LifecycleState {
        BEFORE_CREATE = 0,
        RESUMED,
        PAUSED,
        DESTROYED,
    };
    LifecycleState getLifecycleState();

private:
    void dispatchLifecycleEvent(const LifecycleState state);
    void notifyListeners(const LifecycleState state,
                         const std::vector<std::shared_ptr<LifecycleEventListener>>& listeners);

private:
    const string mPackageName;
    UvLoop* mLoop;
    ActivityStarter mStarter;
    std::shared_ptr<IntentResolver> mResolver;

    std::mutex mLock;
    LifecycleState mState;
    std::shared_ptr<Activity> mCurrentActivity;
    std::vector<std::shared_ptr<LifecycleEventListener>> mListeners;
};

} // namespace bridge
