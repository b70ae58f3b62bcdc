#include "shop/api/cart_controller.hpp"

#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace shop {
namespace api {

namespace {
network::HttpResponse jsonResponse(int status_code, const json& body) {
    network::HttpResponse response;
    response.status_code = status_code;
    response.body = body.dump();
    response.headers["Content-Type"] = "application/json";
    return response;
}

int statusForCartError(core::CartError error) {
    switch (error) {
        case core::CartError::INVALID_ARGUMENT:
            return 400;
        case core::CartError::NOT_FOUND:
            return 404;
        case core::CartError::AMOUNT_OVERFLOW:
            return 422;
    }
    return 500;
}

std::string messageForCartError(core::CartError error) {
    switch (error) {
        case core::CartError::INVALID_ARGUMENT:
            return "Price must be non-negative and quantity greater than zero";
        case core::CartError::NOT_FOUND:
            return "Cart not found";
        case core::CartError::AMOUNT_OVERFLOW:
            return "Cart amount out of range";
    }
    return "Unknown cart error";
}

bool contentTypeIs(const network::HttpRequest& request, const std::string& media_type) {
    auto content_type = network::findHeader(request, "Content-Type");
    return content_type && content_type->find(media_type) != std::string::npos;
}

// JSON strings are taken verbatim, numbers in their shortest textual form
std::string jsonScalarToParameter(const std::string& key, const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number()) {
        return value.dump();
    }
    throw std::invalid_argument("Parameter '" + key + "' must be a string or number");
}
}  // namespace

CartController::CartController(std::shared_ptr<core::CartStore> store,
                               std::shared_ptr<validation::CartRequestValidator> validator,
                               std::shared_ptr<logging::AppLogger> logger)
    : store_(std::move(store)), validator_(std::move(validator)), logger_(std::move(logger)) {
    if (!store_ || !validator_ || !logger_) {
        throw std::invalid_argument("CartController requires a store, validator and logger");
    }
}

void CartController::registerRoutes(network::HttpServer& server) {
    server.registerRoute("POST", "/shop/addItem", [this](const network::HttpRequest& request) {
        return handleAddItem(request);
    });

    server.registerRoute("GET", "/shop/getTotal", [this](const network::HttpRequest& request) {
        return handleGetTotal(request);
    });

    server.registerRoute("GET", "/shop/cart/{cartId}/items",
                         [this](const network::HttpRequest& request) {
                             return handleGetItems(request);
                         });

    server.registerRoute("GET", "/health", [this](const network::HttpRequest& request) {
        return handleHealth(request);
    });
}

network::HttpResponse CartController::handleAddItem(const network::HttpRequest& request) {
    std::map<std::string, std::string> params;
    try {
        params = collectParameters(request);
    } catch (const json::exception& e) {
        return rejectRequest("addItem", 400, "Invalid JSON format: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        return rejectRequest("addItem", 400, e.what());
    }

    auto parsed = validator_->parseAddItemRequest(params);
    if (!parsed) {
        return rejectRequest("addItem", 400, parsed.error().error_message);
    }

    const validation::AddItemRequest& add = parsed.value();
    auto total = store_->addItem(add.cart_id, add.item_name, add.price, add.quantity);
    if (!total) {
        return rejectRequest("addItem for cart " + add.cart_id, statusForCartError(total.error()),
                             messageForCartError(total.error()));
    }

    std::string total_text = total.value().toString();
    logger_->log(logging::LogLevel::INFO, "Cart " + add.cart_id + " total: " + total_text);

    return jsonResponse(200, json{{"message", "Item added successfully"},
                                  {"cartId", add.cart_id},
                                  {"total", total_text}});
}

network::HttpResponse CartController::handleGetTotal(const network::HttpRequest& request) {
    auto cart_id = validator_->parseCartId(request.query_params);
    if (!cart_id) {
        return rejectRequest("getTotal", 400, cart_id.error().error_message);
    }

    auto total = store_->getTotal(cart_id.value());
    if (!total) {
        return rejectRequest("getTotal for cart " + cart_id.value(),
                             statusForCartError(total.error()), messageForCartError(total.error()));
    }

    return jsonResponse(200, json{{"cartId", cart_id.value()}, {"total", total.value().toString()}});
}

network::HttpResponse CartController::handleGetItems(const network::HttpRequest& request) {
    auto cart_id = validator_->parseCartId(request.path_params);
    if (!cart_id) {
        return rejectRequest("getItems", 400, cart_id.error().error_message);
    }

    auto items = store_->getItems(cart_id.value());
    if (!items) {
        return rejectRequest("getItems for cart " + cart_id.value(),
                             statusForCartError(items.error()), messageForCartError(items.error()));
    }

    json lines = json::array();
    core::Decimal total = core::Decimal::zero();
    for (const auto& item : items.value()) {
        lines.push_back(json{{"name", item.name},
                             {"unitPrice", item.unit_price.toString()},
                             {"quantity", item.quantity},
                             {"subtotal", item.subtotal.toString()}});
        total += item.subtotal;
    }

    return jsonResponse(
        200, json{{"cartId", cart_id.value()}, {"items", lines}, {"total", total.toString()}});
}

network::HttpResponse CartController::handleHealth(const network::HttpRequest& request) {
    (void)request;
    return jsonResponse(200, json{{"status", "healthy"}, {"carts", store_->cartCount()}});
}

std::map<std::string, std::string> CartController::collectParameters(
    const network::HttpRequest& request) const {
    std::map<std::string, std::string> params = request.query_params;

    if (request.body.empty()) {
        return params;
    }

    if (contentTypeIs(request, "application/x-www-form-urlencoded")) {
        for (auto& [key, value] : network::parseQueryParameters(request.body)) {
            params[key] = std::move(value);
        }
    } else if (contentTypeIs(request, "application/json")) {
        json body = json::parse(request.body);
        if (!body.is_object()) {
            throw std::invalid_argument("JSON body must be an object");
        }
        for (const char* key : {"cartId", "itemName", "price", "quantity"}) {
            if (body.contains(key)) {
                params[key] = jsonScalarToParameter(key, body.at(key));
            }
        }
    }

    return params;
}

network::HttpResponse CartController::rejectRequest(const std::string& context, int status_code,
                                                    const std::string& message) {
    logger_->log(logging::LogLevel::WARNING, "Rejected " + context + ": " + message);
    return jsonResponse(status_code, json{{"error", message}});
}

}  // namespace api
}  // namespace shop
