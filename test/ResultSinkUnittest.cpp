#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "Fakes.hpp"
#include "ResultSink.hpp"

TEST(ResultSink, LineFormats) {
    EXPECT_EQ(LookupResult::Found("abc", "p:w").ToString(), "abc:p:w");
    EXPECT_EQ(LookupResult::NotFound("abc").ToString(), "abc:[not found]");
    EXPECT_EQ(LookupResult::Failed("abc").ToString(), "abc:[lookup failed]");
    EXPECT_EQ(LookupResult::Found("abc", "p:w").ToString(true), "abc:$HEX[703a77]");
}

TEST(ResultSink, RecordsInOrder) {
    std::ostringstream live;
    ResultSink sink(live);

    EXPECT_TRUE(sink.Record(LookupResult::Found("aa", "one")));
    EXPECT_TRUE(sink.Record(LookupResult::NotFound("bb")));
    EXPECT_TRUE(sink.Record(LookupResult::Failed("cc")));

    EXPECT_EQ(live.str(), "aa:one\nbb:[not found]\ncc:[lookup failed]\n");
    EXPECT_EQ(sink.GetTotal(), 3);
    EXPECT_EQ(sink.GetFound(), 1);
    EXPECT_EQ(sink.GetNotFound(), 1);
    EXPECT_EQ(sink.GetFailed(), 1);
    EXPECT_EQ(sink.GetResults()[2].Hash, "cc");
}

TEST(ResultSink, RejectsDuplicates) {
    std::ostringstream live;
    ResultSink sink(live);

    EXPECT_TRUE(sink.Record(LookupResult::NotFound("aa")));
    EXPECT_FALSE(sink.Record(LookupResult::Found("aa", "late")));
    EXPECT_EQ(sink.GetTotal(), 1);
    EXPECT_EQ(sink.Find("aa")->Status, LookupResultNotFound);
    EXPECT_FALSE(sink.Find("zz").has_value());
}

TEST(ResultSink, AppendsToFile) {
    TempDirectory dir("sink");
    auto path = dir.Write("results.txt", "previous:line\n");
    std::ostringstream live;

    {
        ResultSink sink(live);
        ASSERT_TRUE(sink.Open(path));
        EXPECT_TRUE(sink.IsFileOpen());
        sink.Record(LookupResult::Found("aa", "one"));
        // Each line is flushed as it is recorded
        EXPECT_EQ(ReadFile(path), "previous:line\naa:one\n");
        sink.Record(LookupResult::Failed("bb"));
    }

    EXPECT_EQ(ReadFile(path), "previous:line\naa:one\nbb:[lookup failed]\n");
}

TEST(ResultSink, UnwritableFileFallsBackToTerminal) {
    std::ostringstream live;
    ResultSink sink(live);

    EXPECT_FALSE(sink.Open("/nonexistent/hashlookup/results.txt"));
    EXPECT_FALSE(sink.IsFileOpen());
    EXPECT_TRUE(sink.Record(LookupResult::NotFound("aa")));
    EXPECT_EQ(live.str(), "aa:[not found]\n");
}

TEST(ResultSink, Hexlify) {
    std::ostringstream live;
    ResultSink sink(live);
    sink.SetHexlify(true);
    sink.Record(LookupResult::Found("aa", "caf\xc3\xa9"));
    EXPECT_EQ(live.str(), "aa:$HEX[636166c3a9]\n");
}

TEST(ResultSink, ResetForgetsResults) {
    std::ostringstream live;
    ResultSink sink(live);

    sink.Record(LookupResult::Found("aa", "one"));
    sink.Record(LookupResult::Failed("bb"));
    sink.Reset();

    EXPECT_EQ(sink.GetTotal(), 0);
    EXPECT_EQ(sink.GetFound(), 0);
    EXPECT_EQ(sink.GetFailed(), 0);
    EXPECT_FALSE(sink.Find("aa").has_value());
    EXPECT_TRUE(sink.Record(LookupResult::NotFound("aa")));
}
