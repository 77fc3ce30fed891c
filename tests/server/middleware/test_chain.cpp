/*
 * test_chain.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Tests for middleware chain ordering

**************************************************/

#include <gtest/gtest.h>

#include "server/middleware/chain.hpp"

#include <string>
#include <vector>

using namespace skygate::server::middleware;

namespace {

/// Records entry and exit around next()
class TracingStage : public Middleware {
public:
    TracingStage(std::string name, std::vector<std::string>& trace,
                 bool shortCircuit = false)
        : name_(std::move(name)), trace_(trace), shortCircuit_(shortCircuit) {}

    [[nodiscard]] std::string_view name() const override { return name_; }

    void handle(const crow::request&, crow::response& res, RequestContext&,
                const Next& next) override {
        trace_.push_back(name_ + ":in");
        if (shortCircuit_) {
            res.code = 418;
            trace_.push_back(name_ + ":stop");
            return;
        }
        next();
        trace_.push_back(name_ + ":out");
    }

private:
    std::string name_;
    std::vector<std::string>& trace_;
    bool shortCircuit_;
};

}  // namespace

TEST(MiddlewareChainTest, StagesWrapInInsertionOrder) {
    std::vector<std::string> trace;
    MiddlewareChain chain;
    chain.use(std::make_shared<TracingStage>("a", trace))
        .use(std::make_shared<TracingStage>("b", trace));

    crow::request req;
    crow::response res;
    chain.run(req, res, [&](const crow::request&, crow::response&,
                            RequestContext&) { trace.push_back("handler"); });

    EXPECT_EQ(trace, (std::vector<std::string>{"a:in", "b:in", "handler",
                                               "b:out", "a:out"}));
    EXPECT_EQ(chain.stageNames(), (std::vector<std::string>{"a", "b"}));
}

TEST(MiddlewareChainTest, ShortCircuitSkipsHandler) {
    std::vector<std::string> trace;
    MiddlewareChain chain;
    chain.use(std::make_shared<TracingStage>("outer", trace))
        .use(std::make_shared<TracingStage>("gate", trace, true))
        .use(std::make_shared<TracingStage>("inner", trace));

    crow::request req;
    crow::response res;
    bool handled = false;
    chain.run(req, res,
              [&](const crow::request&, crow::response&, RequestContext&) {
                  handled = true;
              });

    EXPECT_FALSE(handled);
    EXPECT_EQ(res.code, 418);
    EXPECT_EQ(trace, (std::vector<std::string>{"outer:in", "gate:in",
                                               "gate:stop", "outer:out"}));
}

TEST(MiddlewareChainTest, EmptyChainRunsHandler) {
    MiddlewareChain chain;
    chain.use(nullptr);
    EXPECT_EQ(chain.size(), 0u);

    crow::request req;
    crow::response res;
    RequestContext ctx;
    chain.run(req, res, ctx,
              [](const crow::request&, crow::response&, RequestContext& c) {
                  c.authenticated = true;
              });
    EXPECT_TRUE(ctx.authenticated);
}
