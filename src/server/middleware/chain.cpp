/*
 * chain.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "chain.hpp"

namespace skygate::server::middleware {

auto MiddlewareChain::use(std::shared_ptr<Middleware> stage)
    -> MiddlewareChain& {
    if (stage) {
        stages_.push_back(std::move(stage));
    }
    return *this;
}

void MiddlewareChain::run(const crow::request& req, crow::response& res,
                          RequestContext& ctx, const Handler& handler) const {
    dispatch(0, req, res, ctx, handler);
}

void MiddlewareChain::run(const crow::request& req, crow::response& res,
                          const Handler& handler) const {
    RequestContext ctx;
    dispatch(0, req, res, ctx, handler);
}

auto MiddlewareChain::stageNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(stages_.size());
    for (const auto& stage : stages_) {
        names.emplace_back(stage->name());
    }
    return names;
}

void MiddlewareChain::dispatch(size_t index, const crow::request& req,
                               crow::response& res, RequestContext& ctx,
                               const Handler& handler) const {
    if (index == stages_.size()) {
        if (handler) {
            handler(req, res, ctx);
        }
        return;
    }
    stages_[index]->handle(req, res, ctx, [&, index] {
        dispatch(index + 1, req, res, ctx, handler);
    });
}

}  // namespace skygate::server::middleware
