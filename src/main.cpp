#include "server.hpp"
#include "logger.hpp"
#include "webapi_path.hpp"
#include "greeting_api.hpp"
#include "cors.hpp"
#include "env.hpp"

using enum http::method;

int main() {
    try {
        util::log::info("Application starting...");

        server s;

        s.register_api(webapi_path{"/greet"}, get, &greeting::greet);
        s.register_api(webapi_path{"/greetme"}, post, &greeting::greetme);

        s.start();

        util::log::info("Application shutting down gracefully.");

    } catch (const cors::config_error& e) {
        util::log::critical("Invalid CORS configuration: {}", e.what());
        return 1;
    } catch (const env::error& e) {
        util::log::critical("Invalid environment configuration: {}", e.what());
        return 1;
    } catch (const server_error& e) {
        util::log::critical("A critical server error occurred: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        util::log::critical("An unexpected error occurred: {}", e.what());
        return 1;
    }

    return 0;
}
