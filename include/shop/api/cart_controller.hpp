#pragma once

#include <map>
#include <memory>
#include <string>

#include "shop/core/cart_store.hpp"
#include "shop/logging/app_logger.hpp"
#include "shop/network/http_server.hpp"
#include "shop/validation/cart_request_validator.hpp"

namespace shop {
namespace api {

// HTTP front of the cart store.
//
//   POST /shop/addItem              cartId, itemName, price, quantity
//   GET  /shop/getTotal             cartId
//   GET  /shop/cart/{cartId}/items
//   GET  /health
//
// Parameters come from the query string, a form-urlencoded body or a JSON
// object body. Amounts are rendered as JSON strings so their scale survives.
class CartController {
  public:
    CartController(std::shared_ptr<core::CartStore> store,
                   std::shared_ptr<validation::CartRequestValidator> validator,
                   std::shared_ptr<logging::AppLogger> logger);
    ~CartController() = default;

    void registerRoutes(network::HttpServer& server);

    network::HttpResponse handleAddItem(const network::HttpRequest& request);
    network::HttpResponse handleGetTotal(const network::HttpRequest& request);
    network::HttpResponse handleGetItems(const network::HttpRequest& request);
    network::HttpResponse handleHealth(const network::HttpRequest& request);

  private:
    std::shared_ptr<core::CartStore> store_;
    std::shared_ptr<validation::CartRequestValidator> validator_;
    std::shared_ptr<logging::AppLogger> logger_;

    // Merges query and body parameters; body values win. Throws
    // std::invalid_argument for an unusable body.
    std::map<std::string, std::string> collectParameters(
        const network::HttpRequest& request) const;

    network::HttpResponse rejectRequest(const std::string& context, int status_code,
                                        const std::string& message);
};

}  // namespace api
}  // namespace shop
