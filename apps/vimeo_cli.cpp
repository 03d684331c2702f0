#include "vimeo/client.hpp"
#include "vimeo/error.hpp"
#include "vimeo/logging.hpp"
#include "vimeo/uploads.hpp"
#include "vimeo/videos.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
  std::cerr << "usage:\n"
            << "  vimeo_cli upload <file> [--name NAME] [--description TEXT] [--privacy VIEW]\n"
            << "  vimeo_cli get <video-id>\n"
            << "  vimeo_cli list [query]\n"
            << "\n"
            << "VIMEO_ACCESS_TOKEN must be set. VIMEO_LOG=debug enables request logging.\n";
}

nlohmann::json error_to_json(const vimeo::RequestError& error) {
  nlohmann::json out;
  out["step"] = error.step;
  out["kind"] = vimeo::to_string(error.kind);
  out["message"] = error.message;
  if (error.status_code != 0) {
    out["status"] = error.status_code;
  }
  return out;
}

int run_upload(vimeo::VimeoClient& client, const std::vector<std::string>& args) {
  if (args.empty()) {
    print_usage();
    return 1;
  }
  const std::string& path = args[0];
  vimeo::VideoProperties properties;
  for (std::size_t i = 1; i < args.size(); ++i) {
    const std::string& flag = args[i];
    if (i + 1 >= args.size()) {
      std::cerr << "missing value for " << flag << "\n";
      return 1;
    }
    const std::string& value = args[++i];
    if (flag == "--name") {
      properties.name = value;
    } else if (flag == "--description") {
      properties.description = value;
    } else if (flag == "--privacy") {
      auto view = vimeo::parse_privacy_view(value);
      if (!view) {
        std::cerr << "unknown privacy view: " << value << "\n";
        return 1;
      }
      properties.privacy_view = *view;
    } else {
      std::cerr << "unknown option: " << flag << "\n";
      return 1;
    }
  }

  auto outcome = client.uploads().upload_file(path, properties);

  nlohmann::json report;
  if (outcome.video_id) {
    report["video_id"] = *outcome.video_id;
  }
  if (outcome.video) {
    report["video"] = outcome.video->raw;
  }
  report["errors"] = nlohmann::json::array();
  for (const auto& error : outcome.errors) {
    report["errors"].push_back(error_to_json(error));
  }
  std::cout << report.dump(2) << std::endl;
  return outcome.ok() ? 0 : 1;
}

int run_get(vimeo::VimeoClient& client, const std::vector<std::string>& args) {
  if (args.size() != 1) {
    print_usage();
    return 1;
  }
  auto video = client.videos().retrieve(args[0]);
  std::cout << video.raw.dump(2) << std::endl;
  return 0;
}

int run_list(vimeo::VimeoClient& client, const std::vector<std::string>& args) {
  if (args.size() > 1) {
    print_usage();
    return 1;
  }
  std::optional<std::string> query;
  if (!args.empty()) {
    query = args[0];
  }
  nlohmann::json listing = nlohmann::json::array();
  for (const auto& video : client.videos().list(query)) {
    listing.push_back({{"id", video.video_id()}, {"name", video.name}, {"link", video.link}});
  }
  std::cout << listing.dump(2) << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }
  const std::string command = argv[1];
  const std::vector<std::string> args(argv + 2, argv + argc);

  try {
    vimeo::ClientOptions options;
    options.logger = [](vimeo::LogLevel level, const std::string& message, const nlohmann::json& details) {
      std::cerr << "[" << vimeo::to_string(level) << "] " << message;
      if (!details.is_null()) {
        std::cerr << " " << details.dump();
      }
      std::cerr << std::endl;
    };

    vimeo::VimeoClient client(std::move(options));

    if (command == "upload") {
      return run_upload(client, args);
    }
    if (command == "get") {
      return run_get(client, args);
    }
    if (command == "list") {
      return run_list(client, args);
    }
    print_usage();
    return 1;
  } catch (const vimeo::APIError& error) {
    std::cerr << "API error " << error.status_code() << ": " << error.what() << "\n";
    return 1;
  } catch (const vimeo::VimeoError& error) {
    std::cerr << "error: " << error.what() << "\n";
    return 1;
  }
}
