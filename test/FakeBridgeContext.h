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

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "bridge/BridgeContext.h"
#include "bridge/Promise.h"
#include "bridge/Uri.h"

namespace test {

using android::OK;
using android::status_t;
using bridge::Intent;

/** Answers getIntent() with the given intents in turn, the last one repeats */
class FakeActivity : public bridge::Activity {
public:
    explicit FakeActivity(const Intent& intent) : mIntents({intent}), mCalls(0), mStartResult(OK) {}
    explicit FakeActivity(const std::vector<Intent>& intents)
          : mIntents(intents), mCalls(0), mStartResult(OK) {}

    const Intent& getIntent() override {
        std::lock_guard<std::mutex> lock(mLock);
        const size_t index = std::min(mCalls++, mIntents.size() - 1);
        return mIntents[index];
    }

    status_t startActivity(const Intent& intent) override {
        std::lock_guard<std::mutex> lock(mLock);
        mStarted.push_back(intent);
        return mStartResult;
    }

    std::vector<Intent> getStarted() {
        std::lock_guard<std::mutex> lock(mLock);
        return mStarted;
    }

    void setStartResult(status_t result) {
        mStartResult = result;
    }

private:
    std::mutex mLock;
    const std::vector<Intent> mIntents;
    size_t mCalls;
    status_t mStartResult;
    std::vector<Intent> mStarted;
};

/** ACTION_VIEW intents resolve by uri scheme, the others by action */
class FakeIntentResolver : public bridge::IntentResolver {
public:
    void addAction(const std::string& action, const std::string& component) {
        mActions[action] = component;
    }
    void addScheme(const std::string& scheme, const std::string& component) {
        mSchemes[scheme] = component;
    }

    bool resolveActivity(const Intent& intent, std::string* component) override {
        if (!intent.mTarget.empty()) {
            *component = intent.mTarget;
            return true;
        }
        if (intent.mAction == Intent::ACTION_VIEW) {
            bridge::Uri uri;
            if (bridge::Uri::parse(intent.mData, &uri) != OK) {
                return false;
            }
            auto it = mSchemes.find(uri.normalizeScheme().getScheme());
            if (it == mSchemes.end()) {
                return false;
            }
            *component = it->second;
            return true;
        }
        auto it = mActions.find(intent.mAction);
        if (it == mActions.end()) {
            return false;
        }
        *component = it->second;
        return true;
    }

private:
    std::map<std::string, std::string> mActions;
    std::map<std::string, std::string> mSchemes;
};

/**
 * A BridgeContext driven by the test: resume() delivers onHostResume synchronously
 * to the listeners registered at that moment.
 */
class FakeBridgeContext : public bridge::BridgeContext {
public:
    explicit FakeBridgeContext(const std::string& packageName = "com.example.app")
          : mPackageName(packageName),
            mStartResult(OK),
            mAddCount(0),
            mRemoveCount(0),
            mMaxListeners(0) {}

    const std::string& getPackageName() const override {
        return mPackageName;
    }

    std::shared_ptr<bridge::Activity> getCurrentActivity() override {
        std::lock_guard<std::mutex> lock(mLock);
        return mActivity;
    }

    std::shared_ptr<bridge::IntentResolver> getIntentResolver() override {
        return mResolver;
    }

    status_t startActivity(const Intent& intent) override {
        std::lock_guard<std::mutex> lock(mLock);
        mStarted.push_back(intent);
        return mStartResult;
    }

    void addLifecycleEventListener(
            const std::shared_ptr<bridge::LifecycleEventListener>& listener) override {
        std::lock_guard<std::mutex> lock(mLock);
        mListeners.push_back(listener);
        mAddCount++;
        mMaxListeners = std::max(mMaxListeners, mListeners.size());
    }

    void removeLifecycleEventListener(
            const std::shared_ptr<bridge::LifecycleEventListener>& listener) override {
        std::lock_guard<std::mutex> lock(mLock);
        auto it = std::find(mListeners.begin(), mListeners.end(), listener);
        if (it != mListeners.end()) {
            mListeners.erase(it);
            mRemoveCount++;
        }
    }

    void setCurrentActivity(const std::shared_ptr<bridge::Activity>& activity) {
        std::lock_guard<std::mutex> lock(mLock);
        mActivity = activity;
    }

    void resume(const std::shared_ptr<bridge::Activity>& activity) {
        std::vector<std::shared_ptr<bridge::LifecycleEventListener>> listeners;
        {
            std::lock_guard<std::mutex> lock(mLock);
            mActivity = activity;
            listeners = mListeners;
        }
        for (const auto& listener : listeners) {
            listener->onHostResume();
        }
    }

    void setResolver(const std::shared_ptr<FakeIntentResolver>& resolver) {
        mResolver = resolver;
    }
    void setStartResult(status_t result) {
        mStartResult = result;
    }

    std::vector<Intent> getStarted() {
        std::lock_guard<std::mutex> lock(mLock);
        return mStarted;
    }
    size_t getListenerCount() {
        std::lock_guard<std::mutex> lock(mLock);
        return mListeners.size();
    }
    size_t getAddCount() {
        std::lock_guard<std::mutex> lock(mLock);
        return mAddCount;
    }
    size_t getRemoveCount() {
        std::lock_guard<std::mutex> lock(mLock);
        return mRemoveCount;
    }
    size_t getMaxListeners() {
        std::lock_guard<std::mutex> lock(mLock);
        return mMaxListeners;
    }

private:
    const std::string mPackageName;
    std::shared_ptr<FakeIntentResolver> mResolver;
    status_t mStartResult;

    std::mutex mLock;
    std::shared_ptr<bridge::Activity> mActivity;
    std::vector<std::shared_ptr<bridge::LifecycleEventListener>> mListeners;
    std::vector<Intent> mStarted;
    size_t mAddCount;
    size_t mRemoveCount;
    size_t mMaxListeners;
};

/** Records "<tag>:<value>" and "<tag>:error(<code>):<message>" in settle order */
class PromiseRecorder {
public:
    bridge::PromisePtr make(const std::string& tag) {
        return std::make_shared<bridge::Promise>(
                [this, tag](const bridge::PromiseValue& value) {
                    add(tag + ":" + bridge::toString(value));
                },
                [this, tag](int32_t code, const std::string& message) {
                    add(tag + ":error(" + std::to_string(code) + "):" + message);
                });
    }

    std::vector<std::string> getEvents() {
        std::lock_guard<std::mutex> lock(mLock);
        return mEvents;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mLock);
        return mEvents.size();
    }

private:
    void add(const std::string& event) {
        std::lock_guard<std::mutex> lock(mLock);
        mEvents.push_back(event);
    }

    std::mutex mLock;
    std::vector<std::string> mEvents;
};

inline Intent viewIntent(const std::string& data) {
    return Intent(Intent::ACTION_VIEW, data);
}

} // namespace test
