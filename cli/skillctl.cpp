// skillctl - operator command line over the skill content store
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "skillkit/skillkit.hpp"

using namespace skillkit;
namespace fs = std::filesystem;

namespace {

void print_usage() {
  std::cout << "skillctl " << version() << " - manage skill bundles\n\n"
            << "Usage: skillctl <command> [args]\n\n"
            << "Commands:\n"
            << "  list                                  List skills, most recently updated first\n"
            << "  import <zip>                          Import a skill archive\n"
            << "  export <slug> [out]                   Export a skill as zip\n"
            << "  tree <slug>                           Print the file tree as JSON\n"
            << "  cat <slug> <path>                     Print a text file\n"
            << "  write <slug> <path> <file>            Replace a file with the content of <file>\n"
            << "  create <slug> <path> [file]           Create a file (empty or from <file>)\n"
            << "  mkdir <slug> <path>                   Create a directory\n"
            << "  rm <slug> <path>                      Delete a file or directory\n"
            << "  delete <slug>                         Delete a skill\n"
            << "  deps <slug> [--tools a,b] [--integrations x] [--skills y]\n"
            << "                                        Show or set dependencies\n"
            << "  resolve <slug>...                     Show the visible closure of a selection\n\n"
            << "Environment:\n"
            << "  SKILLKIT_SAVE_DIR   Where skills are stored\n"
            << "  SKILLKIT_LOG_LEVEL  trace, debug, info, warn, error\n";
}

std::string read_local_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw IoFailure("Cannot read " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::vector<std::string> split_list(const std::string &value) {
  std::vector<std::string> items;
  std::istringstream iss(value);
  std::string item;
  while (std::getline(iss, item, ',')) {
    item = trim(item);
    if (!item.empty()) items.push_back(item);
  }
  return items;
}

json record_json(const skill::SkillRecord &record) {
  json j = record.to_json();
  j["updated_at"] = format_timestamp(record.updated_at);
  j["created_at"] = format_timestamp(record.created_at);
  return j;
}

void require_args(const std::vector<std::string> &args, size_t count) {
  if (args.size() < count) {
    throw ValidationError("Missing arguments, run 'skillctl help' for usage");
  }
}

int run(Runtime &rt, const std::string &command, const std::vector<std::string> &args) {
  auto &store = *rt.store;

  if (command == "list") {
    for (const auto &record : store.list_skills()) {
      std::cout << record.slug << "\t" << record.description << "\n";
    }
    return 0;
  }

  if (command == "import") {
    require_args(args, 1);
    fs::path zip = args[0];
    std::optional<std::string> user;
    if (const char *env = std::getenv("USER")) user = env;
    auto record = store.import_zip(zip.filename().string(), read_local_file(args[0]), user);
    std::cout << "Imported " << record.slug << "\n";
    return 0;
  }

  if (command == "export") {
    require_args(args, 1);
    fs::path tmp = store.export_zip(args[0]);
    fs::path out = args.size() > 1 ? fs::path(args[1]) : fs::current_path() / (args[0] + ".zip");
    std::error_code ec;
    fs::copy_file(tmp, out, fs::copy_options::overwrite_existing, ec);
    std::error_code rm_ec;
    fs::remove(tmp, rm_ec);
    if (ec) {
      throw IoFailure("Cannot write " + out.string() + ": " + ec.message());
    }
    std::cout << "Exported " << args[0] << " to " << out.string() << "\n";
    return 0;
  }

  if (command == "tree") {
    require_args(args, 1);
    json nodes = json::array();
    for (const auto &node : store.tree(args[0])) {
      nodes.push_back(node.to_json());
    }
    std::cout << nodes.dump(2) << "\n";
    return 0;
  }

  if (command == "cat") {
    require_args(args, 2);
    std::cout << store.read_file(args[0], args[1]).content;
    return 0;
  }

  if (command == "write") {
    require_args(args, 3);
    store.update_file(args[0], args[1], read_local_file(args[2]));
    std::cout << "Updated " << args[1] << "\n";
    return 0;
  }

  if (command == "create") {
    require_args(args, 2);
    std::optional<std::string> content;
    if (args.size() > 2) content = read_local_file(args[2]);
    store.create_node(args[0], args[1], false, content);
    std::cout << "Created " << args[1] << "\n";
    return 0;
  }

  if (command == "mkdir") {
    require_args(args, 2);
    store.create_node(args[0], args[1], true, std::nullopt);
    std::cout << "Created " << args[1] << "/\n";
    return 0;
  }

  if (command == "rm") {
    require_args(args, 2);
    store.delete_node(args[0], args[1]);
    std::cout << "Deleted " << args[1] << "\n";
    return 0;
  }

  if (command == "delete") {
    require_args(args, 1);
    store.delete_skill(args[0]);
    std::cout << "Deleted skill " << args[0] << "\n";
    return 0;
  }

  if (command == "deps") {
    require_args(args, 1);
    auto record = store.get_skill(args[0]);
    if (args.size() == 1) {
      std::cout << record_json(record).dump(2) << "\n";
      return 0;
    }

    skill::DependencyLists lists = record.dependencies;
    for (size_t i = 1; i < args.size(); ++i) {
      if (i + 1 >= args.size()) {
        throw ValidationError("Missing value for " + args[i]);
      }
      if (args[i] == "--tools") {
        lists.tools = split_list(args[++i]);
      } else if (args[i] == "--integrations") {
        lists.integrations = split_list(args[++i]);
      } else if (args[i] == "--skills") {
        lists.skills = split_list(args[++i]);
      } else {
        throw ValidationError("Unknown option: " + args[i]);
      }
    }
    std::cout << record_json(store.update_dependencies(args[0], lists)).dump(2) << "\n";
    return 0;
  }

  if (command == "resolve") {
    skill::DependencyResolver resolver(rt.cache);
    std::cout << resolver.resolve(args).to_json().dump(2) << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << command << "\n\n";
  print_usage();
  return 2;
}

}  // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 2;
  }

  std::string command = argv[1];
  if (command == "help" || command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }
  if (command == "version" || command == "--version") {
    std::cout << version() << "\n";
    return 0;
  }

  std::vector<std::string> args(argv + 2, argv + argc);

  try {
    Config config = Config::load_default();
    init(config);
    auto runtime = open_runtime(config);
    return run(*runtime, command, args);
  } catch (const SkillError &e) {
    spdlog::debug("Command '{}' failed with {}", command, to_string(e.code()));
    std::cerr << "Error (" << to_string(e.code()) << "): " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
