#pragma once

#include <string>
#include <utility>

namespace modelcat {

enum class CatalogErrorCode : int {
    kOk = 0,
    kModelDirNotFound = 1,
    kListFailed = 2,
    kCloseFailed = 3,
};

inline const char* to_string(CatalogErrorCode code) {
    switch (code) {
        case CatalogErrorCode::kOk:
            return "OK";
        case CatalogErrorCode::kModelDirNotFound:
            return "MODEL_DIR_NOT_FOUND";
        case CatalogErrorCode::kListFailed:
            return "LIST_FAILED";
        case CatalogErrorCode::kCloseFailed:
            return "CLOSE_FAILED";
    }
    return "UNKNOWN";
}

// kCloseFailed keeps success == true: the catalog state is valid, only a release failed.
struct CatalogResult {
    bool success{true};
    CatalogErrorCode error_code{CatalogErrorCode::kOk};
    std::string error_message;

    bool ok() const { return error_code == CatalogErrorCode::kOk; }

    static CatalogResult failure(CatalogErrorCode code, std::string message) {
        return {false, code, std::move(message)};
    }
};

}  // namespace modelcat
