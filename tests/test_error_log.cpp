// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include <gtest/gtest.h>
#include <rvfs/extra_log.h>

using namespace rvfs;


TEST(ErrorLog, MessagesAreStoredAsUtf8)
{
    ErrorLog log;
    logMsg(log, L"Datei ü", MessageType::warning);
    EXPECT_EQ(log[0].message, "Datei \xC3\xBC");
}


TEST(ExtraLog, FetchReturnsAndClears)
{
    fetchExtraLog();
    logExtraError(L"first");
    logExtraError(L"second");

    const ErrorLog log = fetchExtraLog();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].message, "first");
    EXPECT_EQ(log[1].type, MessageType::error);
    EXPECT_TRUE(fetchExtraLog().empty());
}

