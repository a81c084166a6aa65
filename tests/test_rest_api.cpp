#include <catch2/catch_all.hpp>
#include "../api/server/plx_rest_api.h"
#include "../utils/plx_base64.h"
#include <nlohmann/json.hpp>

namespace {

plx_http_daemon::request make_request(const std::string& method, const std::string& path,
                                      const std::string& body = "") {
  plx_http_daemon::request req;
  req.method = method;
  req.path = path;
  req.body = body;
  return req;
}

std::string error_kind(const plx_http_daemon::response& r) {
  return nlohmann::json::parse(r.body)["error"].get<std::string>();
}

} // namespace

SCENARIO("The REST dispatcher maps outcomes to status codes", "[api]") {
    plx_config config;
    config.max_body_bytes = 1024 * 1024;
    plx_pdf_engine engine(config);
    plx_rest_api api(engine, config);

    const std::string layout = R"({"pages": [{"width": 200, "height": 100, "elements": [
        {"type": "text", "text": "hi", "x": 10, "y": 50}]}]})";

    WHEN("An unknown route is requested") {
        auto r = api.handle(make_request("POST", "/nope"));
        THEN("404") {
            REQUIRE(r.statuscode == 404);
            REQUIRE(error_kind(r) == "not_found");
        }
    }

    WHEN("A conversion route is called with GET") {
        auto r = api.handle(make_request("GET", "/jsonToPdf"));
        THEN("405") {
            REQUIRE(r.statuscode == 405);
        }
    }

    WHEN("A preflight request arrives") {
        auto req = make_request("OPTIONS", "/jsonToPdf");
        req.headers["origin"] = "http://localhost:5173";
        auto r = api.handle(req);
        THEN("204 with CORS headers") {
            REQUIRE(r.statuscode == 204);
            REQUIRE(r.headers["Access-Control-Allow-Origin"] == "http://localhost:5173");
            REQUIRE(r.headers["Access-Control-Allow-Methods"].find("POST") != std::string::npos);
        }
    }

    WHEN("The body exceeded the limit") {
        auto req = make_request("POST", "/jsonToPdf");
        req.too_large = true;
        req.received = 2 * 1024 * 1024;
        auto r = api.handle(req);
        THEN("413") {
            REQUIRE(r.statuscode == 413);
            REQUIRE(error_kind(r) == "payload_too_large");
        }
    }

    WHEN("jsonToPdf receives a body without pages") {
        auto r = api.handle(make_request("POST", "/jsonToPdf", "{}"));
        THEN("400") {
            REQUIRE(r.statuscode == 400);
            REQUIRE(error_kind(r) == "invalid_request");
            REQUIRE(r.headers["Access-Control-Allow-Origin"] == "*");
        }
    }

    WHEN("pdfToJson receives no file") {
        auto r = api.handle(make_request("POST", "/pdfToJson"));
        THEN("400") {
            REQUIRE(r.statuscode == 400);
        }
    }

    WHEN("pdfToJson receives bytes that are not a PDF") {
        auto r = api.handle(make_request("POST", "/pdfToJson", "hello world"));
        THEN("422") {
            REQUIRE(r.statuscode == 422);
            REQUIRE(error_kind(r) == "unprocessable_document");
        }
    }

    WHEN("jsonToPdf receives a valid layout") {
        auto r = api.handle(make_request("POST", "/jsonToPdf", layout));
        THEN("A PDF attachment is returned") {
            REQUIRE(r.statuscode == 200);
            REQUIRE(r.headers["Content-Type"] == "application/pdf");
            REQUIRE(r.headers["Content-Disposition"].find(".pdf\"") != std::string::npos);
            REQUIRE(r.headers["X-Document-Size"] == std::to_string(r.body.size()));
            REQUIRE(r.body.compare(0, 5, "%PDF-") == 0);
        }

        AND_WHEN("The PDF is uploaded as a multipart file") {
            auto upload = make_request("POST", "/pdfToJson");
            upload.form["file"] = r.body;
            auto back = api.handle(upload);

            THEN("The layout JSON comes back") {
                REQUIRE(back.statuscode == 200);
                REQUIRE(back.headers["Content-Type"] == "application/json");
                nlohmann::json doc = nlohmann::json::parse(back.body);
                REQUIRE(doc["pages"][0]["elements"][0]["text"].get<std::string>() == "hi");
            }
        }
    }

    WHEN("jsonToPdf is asked for the JSON envelope") {
        auto req = make_request("POST", "/jsonToPdf", layout);
        req.params["format"] = "json";
        auto r = api.handle(req);
        THEN("filename, size and base64 data are returned") {
            REQUIRE(r.statuscode == 200);
            nlohmann::json envelope = nlohmann::json::parse(r.body);
            std::string pdf;
            REQUIRE(plx_base64_decode(envelope["data"].get<std::string>(), pdf));
            REQUIRE(envelope["size"].get<size_t>() == pdf.size());
            REQUIRE(envelope["filename"].get<std::string>().size() == 20);
        }
    }
}
