#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <vector>

namespace hostlink::adapters::primary {

/**
 * @brief Цепочка middleware + handler
 *
 * Каждый элемент либо формирует ответ (статус != 0) и прерывает цепочку,
 * либо оставляет статус 0 и передаёт запрос следующему.
 */
class ChainHandler : public IHttpHandler {
public:
    template <typename... Handlers>
    explicit ChainHandler(Handlers&&... handlers)
    {
        (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
    }

    void handle(IRequest& req, IResponse& res) override
    {
        for (auto& h : handlers_) {
            h->handle(req, res);
            if (res.getStatus() != 0) {
                return;
            }
        }

        // статус 0 после последнего звена - ошибка в самом handler
        std::cerr << "[ChainHandler] Error: chain finished with zero status" << std::endl;
        nlohmann::json error;
        error["error"] = "Internal server error";
        res.setResult(500, "application/json", error.dump());
    }

private:
    std::vector<std::shared_ptr<IHttpHandler>> handlers_;
};

} // namespace hostlink::adapters::primary
