#ifndef SKYGATE_SERVER_CONTROLLER_CONTROLLER_HPP
#define SKYGATE_SERVER_CONTROLLER_CONTROLLER_HPP

#include "../app.hpp"
#include "../middleware/chain.hpp"

namespace skygate::server::controller {

/**
 * @brief Base class for all HTTP controllers
 *
 * All controllers must inherit from this class and implement
 * the registerRoutes() method to define their HTTP endpoints. Handlers
 * are run through the shared request pipeline with serve().
 */
class Controller {
public:
    explicit Controller(const middleware::MiddlewareChain& chain)
        : chain_(chain) {}

    virtual ~Controller() = default;

    /**
     * @brief Register HTTP routes with the Crow application
     * @param app The Crow application instance
     */
    virtual void registerRoutes(ServerApp& app) = 0;

protected:
    void serve(const crow::request& req, crow::response& res,
               const middleware::Handler& handler) const {
        chain_.run(req, res, handler);
        res.end();
    }

private:
    const middleware::MiddlewareChain& chain_;
};

}  // namespace skygate::server::controller

#endif  // SKYGATE_SERVER_CONTROLLER_CONTROLLER_HPP
