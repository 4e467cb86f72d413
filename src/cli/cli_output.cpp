#include <ktree/cli/cli_output.h>

#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <iostream>
#include <sstream>

namespace ktree::cli {

using json = nlohmann::json;

Result<json> readJsonInput(const std::string& file) {
    std::string text;
    if (file == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        text = buffer.str();
    } else {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            return Error{ErrorCode::NotFound, fmt::format("Cannot open input file {}", file)};
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        text = buffer.str();
    }

    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Input {} is not valid JSON: {}", file, e.what())};
    }
}

json toJson(const graph::SideEffectReport& report) {
    json failures = json::array();
    for (const auto& f : report.failures) {
        failures.push_back({{"path", f.path}, {"error", f.error.describe()}});
    }
    return json{{"attempted", report.attempted},
                {"modified", report.modified},
                {"failures", std::move(failures)}};
}

void printJson(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

void printWarnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) {
        std::cerr << "[WARN] " << w << "\n";
    }
}

} // namespace ktree::cli
