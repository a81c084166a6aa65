#include <catch2/catch_all.hpp>
#include "../api/server/plx_conversion_service.h"
#include "../utils/plx_exceptions.h"
#include "../utils/plx_hash.h"
#include <nlohmann/json.hpp>

using Catch::Approx;

SCENARIO("Reconstruct and extract through the service", "[service]") {
    plx_config config;
    plx_pdf_engine engine(config);
    plx_conversion_service service(engine, config);

    GIVEN("A layout document with two pages") {
        const std::string body = R"({"pages": [
            {"width": 612, "height": 792, "elements": [
                {"type": "text", "text": "Invoice", "x": 72, "y": 72, "fontSize": 20},
                {"type": "text", "text": "Total: 42", "x": 72, "y": 700}
            ]},
            {"width": 300, "height": 200, "elements": []}
        ]})";

        WHEN("It is reconstructed") {
            plx_document_result result = service.reconstruct(body);

            THEN("The result carries bytes, size and a content-addressable name") {
                REQUIRE(result.size == result.data.size());
                REQUIRE(result.size > 0);
                REQUIRE(result.filename == plx_fnv1a64_hex(result.data) + ".pdf");
            }

            THEN("Extracting it again keeps the strings and page sizes") {
                nlohmann::json doc = nlohmann::json::parse(service.extract(result.data));
                REQUIRE(doc["pages"].size() == 2);
                REQUIRE(doc["pages"][1]["width"].get<double>() == Approx(300));
                REQUIRE(doc["pages"][1]["elements"].empty());

                const auto& elements = doc["pages"][0]["elements"];
                REQUIRE(elements.size() == 2);
                REQUIRE(elements[0]["text"].get<std::string>() == "Invoice");
                REQUIRE(elements[0]["fontSize"].get<double>() == Approx(20).margin(0.01));
                REQUIRE(elements[1]["text"].get<std::string>() == "Total: 42");
                REQUIRE(elements[1]["fontSize"].get<double>() == Approx(12).margin(0.01));
                REQUIRE(elements[1]["y"].get<double>() == Approx(700).margin(1.0));
            }
        }
    }

    GIVEN("An empty pages array") {
        plx_document_result result = service.reconstruct(R"({"pages": []})");

        THEN("Extract of the zero page document yields no pages") {
            nlohmann::json doc = nlohmann::json::parse(service.extract(result.data));
            REQUIRE(doc["pages"].is_array());
            REQUIRE(doc["pages"].empty());
        }
    }

    GIVEN("Unusable input") {
        THEN("User errors are raised before any engine call") {
            REQUIRE_THROWS_AS(service.reconstruct("{}"), plx_user_error);
            REQUIRE_THROWS_AS(service.reconstruct(""), plx_user_error);
            REQUIRE_THROWS_AS(service.reconstruct(R"({"pages": {}})"), plx_user_error);
            REQUIRE_THROWS_AS(service.extract(""), plx_user_error);
        }

        THEN("A broken PDF is a processing error") {
            REQUIRE_THROWS_AS(service.extract("%PDF-1.7 truncated"), plx_processing_error);
        }
    }
}

SCENARIO("The service honors strict element parsing", "[service]") {
    plx_config config;
    config.strict_elements = true;
    plx_pdf_engine engine(config);
    plx_conversion_service service(engine, config);

    THEN("An unknown element type is rejected") {
        REQUIRE_THROWS_AS(service.reconstruct(R"({"pages": [{"width": 100, "height": 100,
            "elements": [{"type": "circle"}]}]})"), plx_user_error);
    }
}
