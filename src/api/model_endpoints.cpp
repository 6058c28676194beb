#include "api/model_endpoints.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "models/language_matcher.h"
#include "models/model_catalog.h"
#include "models/model_json.h"
#include "utils/json_utils.h"

namespace modelcat {

ModelEndpoints::ModelEndpoints(ModelCatalog& catalog) : catalog_(catalog) {}

void ModelEndpoints::registerRoutes(httplib::Server& server) {
    server.Get("/api/model-list", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(json_to_string(modelListToJson(catalog_.allModels())), "application/json");
    });

    // model digest or name
    server.Get(R"(/api/model/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string dn = req.matches[1].str();

        auto basic = catalog_.modelBasicByDigestOrName(dn);
        if (!basic) {
            spdlog::debug("Model not found: {}", dn);
            res.status = 404;
            nlohmann::json body = {{"error", "model not found"}, {"model", dn}};
            res.set_content(json_to_string(body), "application/json");
            return;
        }

        // the model may disappear between the two reads if a refresh swaps the catalog
        auto codes = catalog_.languageCodes(basic->digest);
        if (!codes) {
            res.status = 404;
            nlohmann::json body = {{"error", "model not found"}, {"model", dn}};
            res.set_content(json_to_string(body), "application/json");
            return;
        }

        const auto preferred = parseAcceptLanguage(req.get_header_value("Accept-Language"));
        auto lang = catalog_.matchLanguage(basic->digest, preferred);

        nlohmann::json body = {
            {"model", modelBasicToJson(*basic)},
            {"lang_codes", *codes},
            {"lang", lang ? *lang : std::string()},
        };
        if (lang) res.set_header("Content-Language", *lang);
        res.set_content(json_to_string(body), "application/json");
    });
}

}  // namespace modelcat
