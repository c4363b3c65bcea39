#include "rctx/Describe.hpp"
#include <gtest/gtest.h>
#include <functional>
#include <string>

using namespace rctx;

namespace {

void freeTask() {}

struct QuoteRefresh {
    void operator()() const {}
};

struct SelfDescribing {
    void operator()() const {}
    std::string describe() const { return "self-describing"; }
};

} // namespace

TEST(DescribeTest, DescribeMemberWins) {
    EXPECT_EQ(describe(SelfDescribing{}), "self-describing");
}

TEST(DescribeTest, FunctorReportsTypeName) {
    EXPECT_NE(describe(QuoteRefresh{}).find("QuoteRefresh"), std::string::npos);
}

TEST(DescribeTest, StdFunctionReportsTarget) {
    std::function<void()> fn = QuoteRefresh{};
    EXPECT_NE(describe(fn).find("QuoteRefresh"), std::string::npos);

    std::function<void()> ptr = &freeTask;
    EXPECT_EQ(describe(ptr), boost::core::demangle(typeid(void (*)()).name()));
}

TEST(DescribeTest, EmptyStdFunction) {
    EXPECT_EQ(describe(std::function<void()>{}), "<empty>");
}

TEST(DescribeTest, NamedTaskForwardsCallAndName) {
    int calls = 0;
    auto task = named("counter", [&calls] { return ++calls; });
    EXPECT_EQ(task(), 1);
    EXPECT_EQ(task(), 2);
    EXPECT_EQ(describe(task), "counter");
}
