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

#define LOG_TAG "HostContext"

#include "bridge/HostContext.h"

#include <algorithm>

#include "bridge/Logger.h"

namespace bridge {

using android::INVALID_OPERATION;
using android::status_t;

HostContext::HostContext(const string& packageName, UvLoop* loop, const ActivityStarter& starter,
                         const std::shared_ptr<IntentResolver>& resolver)
      : mPackageName(packageName),
        mLoop(loop),
        mStarter(starter),
        mResolver(resolver),
        mState(BEFORE_CREATE) {}

std::shared_ptr<HostContext> HostContext::create(const string& packageName, UvLoop* loop,
                                                 const ActivityStarter& starter,
                                                 const std::shared_ptr<IntentResolver>& resolver) {
    return std::make_shared<HostContext>(packageName, loop, starter, resolver);
}

const string& HostContext::getPackageName() const {
    return mPackageName;
}

std::shared_ptr<Activity> HostContext::getCurrentActivity() {
    std::lock_guard<std::mutex> lock(mLock);
    return mCurrentActivity;
}

std::shared_ptr<IntentResolver> HostContext::getIntentResolver() {
    return mResolver;
}

status_t HostContext::startActivity(const Intent& intent) {
    if (!mStarter) {
        ALOGE("HostContext[%s] can't start %s without a starter", mPackageName.c_str(),
              intent.toString().c_str());
        return INVALID_OPERATION;
    }
    return mStarter(intent);
}

void HostContext::addLifecycleEventListener(
        const std::shared_ptr<LifecycleEventListener>& listener) {
    bool resumed = false;
    {
        std::lock_guard<std::mutex> lock(mLock);
        if (std::find(mListeners.begin(), mListeners.end(), listener) != mListeners.end()) {
            return;
        }
        mListeners.push_back(listener);
        resumed = (mState == RESUMED && mCurrentActivity != nullptr);
    }
    // a listener added to a resumed host with an activity still receives the resume event
    if (resumed) {
        notifyListeners(RESUMED, {listener});
    }
}

void HostContext::removeLifecycleEventListener(
        const std::shared_ptr<LifecycleEventListener>& listener) {
    std::lock_guard<std::mutex> lock(mLock);
    auto it = std::find(mListeners.begin(), mListeners.end(), listener);
    if (it != mListeners.end()) {
        mListeners.erase(it);
    }
}

void HostContext::onHostResume(const std::shared_ptr<Activity>& activity) {
    {
        std::lock_guard<std::mutex> lock(mLock);
        mCurrentActivity = activity;
        mState = RESUMED;
    }
    ALOGD("HostContext[%s] onHostResume", mPackageName.c_str());
    dispatchLifecycleEvent(RESUMED);
}

void HostContext::onHostPause() {
    {
        std::lock_guard<std::mutex> lock(mLock);
        mState = PAUSED;
    }
    ALOGD("HostContext[%s] onHostPause", mPackageName.c_str());
    dispatchLifecycleEvent(PAUSED);
}

void HostContext::onHostDestroy() {
    {
        std::lock_guard<std::mutex> lock(mLock);
        mCurrentActivity.reset();
        mState = DESTROYED;
    }
    ALOGD("HostContext[%s] onHostDestroy", mPackageName.c_str());
    dispatchLifecycleEvent(DESTROYED);
}

size_t HostContext::getLifecycleEventListenerCount() {
    std::lock_guard<std::mutex> lock(mLock);
    return mListeners.size();
}

HostContext::LifecycleState HostContext::getLifecycleState() {
    std::lock_guard<std::mutex> lock(mLock);
    return mState;
}

void HostContext::dispatchLifecycleEvent(const LifecycleState state) {
    std::vector<std::shared_ptr<LifecycleEventListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(mLock);
        listeners = mListeners;
    }
    notifyListeners(state, listeners);
}

void HostContext::notifyListeners(
        const LifecycleState state,
        const std::vector<std::shared_ptr<LifecycleEventListener>>& listeners) {
    auto notify = [state, listeners]() {
        for (const auto& listener : listeners) {
            switch (state) {
                case RESUMED:
                    listener->onHostResume();
                    break;
                case PAUSED:
                    listener->onHostPause();
                    break;
                case DESTROYED:
                    listener->onHostDestroy();
                    break;
                default:
                    break;
            }
        }
    };

    if (!mLoop) {
        notify();
        return;
    }
    const int ret = mLoop->postTask(notify);
    if (ret != 0) {
        ALOGE("HostContext[%s] post lifecycle event(%d) failure:%s", mPackageName.c_str(), state,
              uv_strerror(ret));
    }
}

} // namespace bridge
