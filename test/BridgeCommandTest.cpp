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


#include <gtest/gtest.h>
#include <utils/String16.h>

#include "BridgeCommand.h"

using namespace bridge;
using android::String16;
using android::os::PersistableBundle;

namespace test {

TEST(BridgeCommandTest, putTypedExtras) {
    PersistableBundle bundle;
    EXPECT_EQ(BridgeCommand::putExtra("--es", "name", "XiaoMing", bundle), 0);
    EXPECT_EQ(BridgeCommand::putExtra("-e", "city", "Beijing", bundle), 0);
    EXPECT_EQ(BridgeCommand::putExtra("--ei", "age", "24", bundle), 0);
    EXPECT_EQ(BridgeCommand::putExtra("--eu", "height", "183.5", bundle), 0);
    EXPECT_EQ(BridgeCommand::putExtra("--ez", "student", "true", bundle), 0);

    String16 name;
    EXPECT_TRUE(bundle.getString(String16("name"), &name));
    EXPECT_EQ(name, String16("XiaoMing"));
    EXPECT_TRUE(bundle.getString(String16("city"), &name));
    int32_t age = 0;
    EXPECT_TRUE(bundle.getInt(String16("age"), &age));
    EXPECT_EQ(age, 24);
    double height = 0;
    EXPECT_TRUE(bundle.getDouble(String16("height"), &height));
    EXPECT_DOUBLE_EQ(height, 183.5);
    bool student = false;
    EXPECT_TRUE(bundle.getBoolean(String16("student"), &student));
    EXPECT_TRUE(student);
}

TEST(BridgeCommandTest, badValuesAreRefused) {
    PersistableBundle bundle;
    EXPECT_EQ(BridgeCommand::putExtra("--ei", "age", "abc", bundle), -1);
    EXPECT_EQ(BridgeCommand::putExtra("--ei", "age", "", bundle), -1);
    EXPECT_EQ(BridgeCommand::putExtra("--ei", "age", "12x", bundle), -1);
    EXPECT_EQ(BridgeCommand::putExtra("--ei", "age", "99999999999999999999", bundle), -1);
    EXPECT_EQ(BridgeCommand::putExtra("--eu", "height", "tall", bundle), -1);
    EXPECT_EQ(BridgeCommand::putExtra("--ez", "student", "yes", bundle), -1);
    EXPECT_EQ(BridgeCommand::putExtra("--ei", "", "", bundle), -1);
    EXPECT_EQ(BridgeCommand::putExtra("--ex", "key", "value", bundle), -1);
    EXPECT_TRUE(bundle.empty());
}

} // namespace test
