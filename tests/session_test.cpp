/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "gtest/gtest.h"
#include "curlsession.h"
#include "exceptions.h"
#include "session.h"
#include "test.h"

namespace
{
    using namespace sqc;

    // 2025-06-01 00:00:00 UTC
    const time_t NOW = 1748736000;

    TEST(parseListingLine, File)
    {
        RemoteEntry e;
        ASSERT_TRUE(parseListingLine("-rw-r--r--    1 pilot    staff     8123456 Mar 14 09:26 DJI_0001.JPG", e, NOW));
        EXPECT_EQ(e.name, "DJI_0001.JPG");
        EXPECT_TRUE(e.isFile());
        EXPECT_EQ(e.size, 8123456);
        EXPECT_EQ(e.modifiedTime, 1741944360);
    }

    TEST(parseListingLine, DirectoryWithSpaces)
    {
        RemoteEntry e;
        ASSERT_TRUE(parseListingLine("drwxr-xr-x    2 pilot    staff        4096 Mar 14  2023 Orbit Photos", e, NOW));
        EXPECT_EQ(e.name, "Orbit Photos");
        EXPECT_TRUE(e.isDirectory());
        EXPECT_EQ(e.modifiedTime, 1678752000);
    }

    TEST(parseListingLine, RecentDateFromLastYear)
    {
        RemoteEntry e;
        ASSERT_TRUE(parseListingLine("-rw-r--r--    1 pilot    staff        10 Dec 30 10:00 old.jpg", e, NOW));
        EXPECT_EQ(e.modifiedTime, 1735552800);
    }

    TEST(parseListingLine, Symlink)
    {
        RemoteEntry e;
        ASSERT_TRUE(parseListingLine("lrwxrwxrwx    1 pilot    staff          12 Mar 14 09:26 latest -> orbit", e, NOW));
        EXPECT_EQ(e.name, "latest");
        EXPECT_EQ(e.type, RemoteEntryType::Other);
    }

    TEST(parseListingLine, Skipped)
    {
        RemoteEntry e;
        EXPECT_FALSE(parseListingLine("", e, NOW));
        EXPECT_FALSE(parseListingLine("total 48", e, NOW));
        EXPECT_FALSE(parseListingLine("drwxr-xr-x    2 pilot    staff        4096 Mar 14 09:26 .", e, NOW));
        EXPECT_FALSE(parseListingLine("drwxr-xr-x    2 pilot    staff        4096 Mar 14 09:26 ..", e, NOW));
        EXPECT_FALSE(parseListingLine("-rw-r--r--    1 pilot", e, NOW));
    }

    TEST(parseListingLine, UnknownDate)
    {
        RemoteEntry e;
        ASSERT_TRUE(parseListingLine("-rw-r--r--    1 pilot    staff        10 ??? 99 09:26 odd.jpg", e, NOW));
        EXPECT_EQ(e.name, "odd.jpg");
        EXPECT_EQ(e.modifiedTime, 0);
        EXPECT_TRUE(e.toJSON()["modified"].is_null());
    }

    TEST(remoteEntry, ToJSON)
    {
        RemoteEntry e;
        e.name = "orbit";
        e.type = RemoteEntryType::Directory;
        e.modifiedTime = 1678752000;

        json j = e.toJSON();
        EXPECT_EQ(j["name"], "orbit");
        EXPECT_EQ(j["type"], "directory");
        EXPECT_EQ(j["size"], 0);
        EXPECT_EQ(j["modified"], 1678752000);
    }

    TEST(connectionParams, Protocol)
    {
        EXPECT_EQ(protocolFromString("SFTP"), Protocol::SFTP);
        EXPECT_EQ(protocolFromString("ftp"), Protocol::FTP);
        EXPECT_EQ(protocolFromString("ftps"), Protocol::FTPS);
        EXPECT_THROW(protocolFromString("scp"), InvalidArgsException);
        EXPECT_EQ(protocolToString(Protocol::FTPS), "ftps");
    }

    TEST(connectionParams, IdentityAndValidation)
    {
        ConnectionParams p;
        p.host = "ftp.example.com";
        p.user = "jdoe";
        p.secret = "hunter2";
        EXPECT_EQ(p.identity(), "sftp://jdoe@ftp.example.com:22");
        EXPECT_NO_THROW(p.validate());

        // Never part of the identity
        EXPECT_EQ(p.identity().find("hunter2"), std::string::npos);

        p.port = 0;
        EXPECT_THROW(p.validate(), InvalidArgsException);
        p.port = 21;
        p.user = "";
        EXPECT_THROW(p.validate(), InvalidArgsException);
    }

    TEST(curlSession, InvalidParams)
    {
        ConnectionParams p;
        EXPECT_THROW(CurlSession(p, 1000), InvalidArgsException);
    }

    TEST(curlSession, UnreachableHost)
    {
        ConnectionParams p;
        p.protocol = Protocol::FTP;
        p.host = "127.0.0.1";
        p.port = 1;
        p.user = "nobody";

        EXPECT_THROW(CurlSession(p, 2000), ConnectionException);

        auto factory = CurlSession::factory(p);
        EXPECT_THROW(factory(2000), ConnectionException);
    }

}
