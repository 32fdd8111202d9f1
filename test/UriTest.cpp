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

#include "bridge/Uri.h"

using namespace bridge;

namespace test {

TEST(UriTest, parseKeepsSchemeSpecificPart) {
    Uri uri;
    ASSERT_EQ(Uri::parse("https://example.com/a?b=c#d", &uri), android::OK);
    EXPECT_EQ(uri.getScheme(), "https");
    EXPECT_EQ(uri.getSchemeSpecificPart(), "//example.com/a?b=c#d");
    EXPECT_EQ(uri.toString(), "https://example.com/a?b=c#d");

    ASSERT_EQ(Uri::parse("package:com.example.app", &uri), android::OK);
    EXPECT_EQ(uri.getScheme(), "package");
    EXPECT_EQ(uri.getSchemeSpecificPart(), "com.example.app");

    ASSERT_EQ(Uri::parse("tel:+1-555-0100", &uri), android::OK);
    EXPECT_EQ(uri.getScheme(), "tel");
}

TEST(UriTest, parseRejectsMalformed) {
    Uri uri;
    EXPECT_EQ(Uri::parse("", &uri), android::BAD_VALUE);
    EXPECT_EQ(Uri::parse("no scheme here", &uri), android::BAD_VALUE);
    EXPECT_EQ(Uri::parse("https://exa mple.com", &uri), android::BAD_VALUE);
    EXPECT_EQ(Uri::parse("https://example.com\n", &uri), android::BAD_VALUE);
    EXPECT_EQ(Uri::parse("example.com", &uri), android::BAD_VALUE);
    EXPECT_EQ(Uri::parse("/path/with:colon", &uri), android::BAD_VALUE);
    EXPECT_EQ(Uri::parse("1http://example.com", &uri), android::BAD_VALUE);
    EXPECT_EQ(Uri::parse(":nothing", &uri), android::BAD_VALUE);
    EXPECT_EQ(Uri::parse("ht_tp://example.com", &uri), android::BAD_VALUE);
}

TEST(UriTest, normalizeSchemeOnlyTouchesScheme) {
    Uri uri;
    ASSERT_EQ(Uri::parse("HTTPS://Example.COM/Path", &uri), android::OK);
    const Uri normalized = uri.normalizeScheme();
    EXPECT_EQ(normalized.getScheme(), "https");
    EXPECT_EQ(normalized.toString(), "https://Example.COM/Path");
    EXPECT_EQ(uri.getScheme(), "HTTPS");
}

} // namespace test
