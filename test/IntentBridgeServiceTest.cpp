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

#include <binder/Status.h>
#include <gtest/gtest.h>
#include <utils/String16.h>

#include "FakeBridgeContext.h"
#include "IntentBridgeService.h"
#include "IntentLauncher.h"
#include "bridge/BnIntentCallback.h"

using namespace bridge;
using android::sp;
using android::String16;
using android::binder::Status;
using android::os::PersistableBundle;

namespace test {

class ReplyRecorder : public BnIntentCallback {
public:
    Status onResolve(int32_t seqNo, const std::optional<std::string>& value) override {
        mReplies.push_back(std::to_string(seqNo) + ":" + value.value_or("null"));
        return Status::ok();
    }
    Status onResolveBoolean(int32_t seqNo, bool value) override {
        mReplies.push_back(std::to_string(seqNo) + ":" + (value ? "true" : "false"));
        return Status::ok();
    }
    Status onReject(int32_t seqNo, int32_t code, const std::string& message) override {
        mReplies.push_back(std::to_string(seqNo) + ":error(" + std::to_string(code) +
                           "):" + message);
        return Status::ok();
    }

    std::vector<std::string> mReplies;
};

class IntentBridgeServiceTest : public testing::Test {
protected:
    void SetUp() override {
        mContext = std::make_shared<FakeBridgeContext>("com.example.app");
        auto resolver = std::make_shared<FakeIntentResolver>();
        resolver->addScheme("https", "com.browser/Main");
        resolver->addAction("action.settings.CHANNEL_NOTIFICATION", "com.settings/Channel");
        mContext->setResolver(resolver);
        mService = sp<IntentBridgeService>::make(mContext);
        mReply = sp<ReplyRecorder>::make();
    }

    std::shared_ptr<FakeBridgeContext> mContext;
    sp<IntentBridgeService> mService;
    sp<ReplyRecorder> mReply;
};

TEST_F(IntentBridgeServiceTest, repliesCarrySeqNo) {
    EXPECT_TRUE(mService->getInitialURL(7, mReply).isOk());
    EXPECT_TRUE(mService->canOpenURL(std::string("https://example.com"), 8, mReply).isOk());
    EXPECT_TRUE(mService->openURL(std::nullopt, 9, mReply).isOk());
    EXPECT_EQ(mReply->mReplies.size(), 2u);

    mContext->resume(std::make_shared<FakeActivity>(viewIntent("https://example.com/start")));

    const std::string illegalArgument = std::to_string(Status::EX_ILLEGAL_ARGUMENT);
    EXPECT_EQ(mReply->mReplies,
              std::vector<std::string>({"8:true", "9:error(" + illegalArgument +
                                                          "):Invalid URL: null",
                                        "7:https://example.com/start"}));
}

TEST_F(IntentBridgeServiceTest, nullCallbackIsRejected) {
    const Status status = mService->openSettings(1, nullptr);
    EXPECT_FALSE(status.isOk());
    EXPECT_EQ(status.exceptionCode(), Status::EX_ILLEGAL_ARGUMENT);
}

TEST_F(IntentBridgeServiceTest, sendIntentForwardsBundleExtras) {
    PersistableBundle extras;
    extras.putString(String16("app.package"), String16("com.example.app"));
    extras.putInt(String16("channel"), 3);
    extras.putBoolean(String16("silent"), true);

    EXPECT_TRUE(mService->sendIntent("action.settings.CHANNEL_NOTIFICATION", extras, 11, mReply)
                        .isOk());

    EXPECT_EQ(mReply->mReplies, std::vector<std::string>({"11:true"}));
    const auto started = mContext->getStarted();
    ASSERT_EQ(started.size(), 1u);
    EXPECT_TRUE(started[0].hasFlag(Intent::FLAG_ACTIVITY_NEW_TASK));

    String16 package;
    EXPECT_TRUE(started[0].mExtra.getString(String16("app.package"), &package));
    EXPECT_EQ(package, String16("com.example.app"));
    double channel = 0;
    EXPECT_TRUE(started[0].mExtra.getDouble(String16("channel"), &channel));
    EXPECT_DOUBLE_EQ(channel, 3);
    bool silent = false;
    EXPECT_TRUE(started[0].mExtra.getBoolean(String16("silent"), &silent));
    EXPECT_TRUE(silent);
}

TEST_F(IntentBridgeServiceTest, sendIntentRejectsNestedBundle) {
    PersistableBundle extras;
    extras.putPersistableBundle(String16("nested"), PersistableBundle());

    EXPECT_TRUE(mService->sendIntent("action.settings.CHANNEL_NOTIFICATION", extras, 12, mReply)
                        .isOk());

    EXPECT_EQ(mReply->mReplies,
              std::vector<std::string>({"12:error(" +
                                        std::to_string(Status::EX_ILLEGAL_ARGUMENT) +
                                        "):Extra type for nested not supported."}));
    EXPECT_TRUE(mContext->getStarted().empty());
}

TEST_F(IntentBridgeServiceTest, invalidateDropsPendingReplies) {
    EXPECT_TRUE(mService->getInitialURL(1, mReply).isOk());
    mService->invalidate();
    mContext->resume(std::make_shared<FakeActivity>(viewIntent("https://example.com")));

    EXPECT_TRUE(mReply->mReplies.empty());
    EXPECT_EQ(mContext->getListenerCount(), 0u);
}

TEST(IntentBridgeServiceExtrasTest, bundleTypesMapToExtraValues) {
    PersistableBundle bundle;
    bundle.putBoolean(String16("b"), false);
    bundle.putInt(String16("i"), 5);
    bundle.putLong(String16("l"), 1LL << 40);
    bundle.putDouble(String16("d"), 2.5);
    bundle.putString(String16("s"), String16("text"));
    bundle.putPersistableBundle(String16("m"), PersistableBundle());
    bundle.putIntVector(String16("v"), {1, 2});

    const IntentExtras extras = IntentBridgeService::toIntentExtras(bundle);

    ASSERT_EQ(extras.size(), 7u);
    // sorted by key
    EXPECT_EQ(extras[0].key, "b");
    EXPECT_EQ(extras[0].value.getType(), ExtraValue::TYPE_BOOLEAN);
    EXPECT_FALSE(extras[0].value.getBoolean());
    EXPECT_EQ(extras[1].key, "d");
    EXPECT_DOUBLE_EQ(extras[1].value.getNumber(), 2.5);
    EXPECT_EQ(extras[2].key, "i");
    EXPECT_DOUBLE_EQ(extras[2].value.getNumber(), 5);
    EXPECT_EQ(extras[3].key, "l");
    EXPECT_DOUBLE_EQ(extras[3].value.getNumber(), static_cast<double>(1LL << 40));
    EXPECT_EQ(extras[4].key, "m");
    EXPECT_EQ(extras[4].value.getType(), ExtraValue::TYPE_MAP);
    EXPECT_EQ(extras[5].key, "s");
    EXPECT_EQ(extras[5].value.getString(), "text");
    EXPECT_EQ(extras[6].key, "v");
    EXPECT_EQ(extras[6].value.getType(), ExtraValue::TYPE_ARRAY);
}

TEST(IntentLauncherTest, startArgs) {
    Intent intent(Intent::ACTION_VIEW, "https://example.com");
    intent.setTarget("com.browser/Main");
    intent.addFlags(Intent::FLAG_ACTIVITY_NEW_TASK);
    intent.addCategory(Intent::CATEGORY_DEFAULT);
    intent.mExtra.putString(String16("title"), String16("home"));
    intent.mExtra.putInt(String16("page"), 2);
    intent.mExtra.putDouble(String16("zoom"), 1.5);
    intent.mExtra.putBoolean(String16("incognito"), true);

    EXPECT_EQ(IntentLauncher::makeStartArgs(intent),
              std::vector<std::string>({"start", "-t", "com.browser/Main", "-a",
                                        "action.intent.VIEW", "-d", "https://example.com", "-f",
                                        "1", "--es", "title", "home", "--ei", "page", "2", "--eu",
                                        "zoom", "1.5", "--ez", "incognito", "true"}));
}

TEST(IntentLauncherTest, emptyIntentOnlyStarts) {
    EXPECT_EQ(IntentLauncher::makeStartArgs(Intent()), std::vector<std::string>({"start"}));
}

} // namespace test
