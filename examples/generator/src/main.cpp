// jinglesdp
#include <common/logger.hpp>
#include <sdp/sdp_description.hpp>
#include <sdp/sdp_json.hpp>
#include <sdp/sdp_utils.hpp>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace jinglesdp;

namespace {

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " <input.json> [options]\n"
              << "  --type <offer|answer|pranswer|rollback>  description type (default: offer)\n"
              << "  --role <initiator|responder>             local role (default: initiator)\n"
              << "  --direction <incoming|outgoing>          negotiation direction (default: outgoing)\n"
              << "  --sid <id>                               session id of the origin line\n"
              << "  --time <version>                         session version of the origin line\n"
              << "  --json                                   print {\"type\", \"sdp\"} instead of raw SDP\n"
              << "  --verbose                                verbose logging\n";
}

std::string ReadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

const char* NextArgument(int argc, const char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
    }
    return argv[++i];
}

} // namespace

int main(int argc, const char* argv[]) {
    if (argc < 2) {
        PrintUsage(argv[0]);
        return 1;
    }

    std::string input_path;
    sdp::Type type = sdp::Type::OFFER;
    std::optional<sdp::SessionRole> role;
    std::optional<sdp::NegotiationDirection> direction;
    std::optional<std::string> session_id;
    std::optional<std::string> time;
    bool print_json = false;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--type") {
                type = sdp::StringToType(NextArgument(argc, argv, i));
            } else if (arg == "--role") {
                role = sdp::StringToSessionRole(NextArgument(argc, argv, i));
            } else if (arg == "--direction") {
                direction = sdp::StringToNegotiationDirection(NextArgument(argc, argv, i));
            } else if (arg == "--sid") {
                session_id = NextArgument(argc, argv, i);
            } else if (arg == "--time") {
                time = NextArgument(argc, argv, i);
            } else if (arg == "--json") {
                print_json = true;
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                PrintUsage(argv[0]);
                return 0;
            } else if (input_path.empty()) {
                input_path = arg;
            } else {
                throw std::invalid_argument("Unexpected argument: " + arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        PrintUsage(argv[0]);
        return 1;
    }

    logging::InitLogger(verbose ? logging::Level::VERBOSE : logging::Level::WARNING);

    if (input_path.empty()) {
        PLOG_ERROR << "No input file";
        return 1;
    }

    try {
        auto input = nlohmann::json::parse(ReadFile(input_path));

        // Either a bare session or {"session": {...}, "options": {...}}
        const bool wrapped = input.is_object() && input.contains("session");
        sdp::Session session = sdp::ParseSession(wrapped ? input.at("session") : input);

        sdp::Description::Builder builder(type);
        if (wrapped && input.contains("options")) {
            builder.set_options(sdp::ParseOptions(input.at("options")));
        }
        if (role) {
            builder.set_role(role.value());
        }
        if (direction) {
            builder.set_direction(direction.value());
        }
        if (session_id) {
            builder.set_session_id(session_id);
        }
        if (time) {
            builder.set_time(time);
        }

        auto description = builder.Build(session);
        if (print_json) {
            std::cout << description.ToJson().dump(2) << std::endl;
        } else {
            std::cout << description.sdp();
        }
    } catch (const std::exception& e) {
        PLOG_ERROR << "Failed to generate SDP from " << input_path << ": " << e.what();
        return 1;
    }

    return 0;
}
