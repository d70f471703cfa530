#include "backup/backup_config.hpp"
#include "backup/run_record.hpp"
#include "common/backup_error.hpp"
#include <cctype>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string requireString(const json& node, const std::string& key, const std::string& context) {
    auto it = node.find(key);
    if (it == node.end()) {
        throw ConfigurationError("Missing configuration parameter '" + key + "'" + context);
    }
    if (!it->is_string()) {
        throw ConfigurationError("Configuration parameter '" + key + "'" + context + " must be a string");
    }
    return it->get<std::string>();
}

void checkVersion(const std::string& version) {
    size_t dot = version.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == version.size() ||
        version.find('.', dot + 1) != std::string::npos) {
        throw ConfigurationError("Error parsing configuration's version string '" + version + "'");
    }
    for (size_t i = 0; i < version.size(); ++i) {
        if (i != dot && !std::isdigit(static_cast<unsigned char>(version[i]))) {
            throw ConfigurationError("Error parsing configuration's version string '" + version + "'");
        }
    }
    if (version.substr(0, dot) != "2") {
        throw ConfigurationError("Configuration file format not supported. Found version " + version +
                                 ", only supporting versions 2.x");
    }
}

void checkSetName(const std::string& name, std::set<std::string>& seen) {
    if (name.empty()) {
        throw ConfigurationError("Backup set with empty 'set-name'");
    }
    if (name == "." || name == ".." || name.find('/') != std::string::npos) {
        throw ConfigurationError("Backup set name '" + name + "' is not a valid directory name");
    }
    if (name == RunRecord::kStateFileName || name == RunRecord::kLogFileName) {
        throw ConfigurationError("Backup set name '" + name + "' is reserved");
    }
    if (!seen.insert(name).second) {
        throw ConfigurationError("Duplicate backup set name '" + name + "'");
    }
}

std::vector<std::string> parseSkipEntries(const json& node, const std::string& context) {
    std::vector<std::string> entries;
    auto it = node.find("skip-entries");
    if (it == node.end() || it->is_null()) {
        return entries;
    }
    if (!it->is_array()) {
        throw ConfigurationError("'skip-entries'" + context + " must be an array of strings");
    }
    for (const auto& entry : *it) {
        if (!entry.is_string()) {
            throw ConfigurationError("'skip-entries'" + context + " must be an array of strings");
        }
        std::string value = entry.get<std::string>();
        if (value.empty() || value.find('/') != std::string::npos) {
            throw ConfigurationError("Skip entry '" + value + "'" + context +
                                     " must be a plain file or directory name");
        }
        entries.push_back(value);
    }
    return entries;
}

BackupSetConfig parseBackupSet(const json& node, std::set<std::string>& seen) {
    if (!node.is_object()) {
        throw ConfigurationError("Every entry of 'backup-sets' must be an object");
    }

    BackupSetConfig set;
    set.name = requireString(node, "set-name", "");
    checkSetName(set.name, seen);

    const std::string context = " in backup set '" + set.name + "'";
    std::string type = requireString(node, "type", context);
    std::string sourceDir = requireString(node, "source-dir", context);
    if (sourceDir.empty() || sourceDir[0] != '/') {
        throw ConfigurationError("'source-dir'" + context + " must be an absolute path");
    }

    if (type == "local dir") {
        set.source = LocalSource{sourceDir};
    } else if (type == "remote dir") {
        RemoteSource remote;
        remote.shell = requireString(node, "remote-shell", context);
        remote.host = requireString(node, "remote-host", context);
        remote.path = sourceDir;
        if (remote.shell.empty() || remote.host.empty()) {
            throw ConfigurationError("'remote-shell' and 'remote-host'" + context + " must not be empty");
        }
        set.source = remote;
    } else {
        throw ConfigurationError("Unknown backup set type '" + type + "'" + context);
    }

    set.skipEntries = parseSkipEntries(node, context);
    return set;
}

} // namespace

BackupConfig parseBackupConfig(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("Could not parse configuration (") + e.what() + ")");
    }
    if (!root.is_object()) {
        throw ConfigurationError("Configuration must be a single JSON object");
    }

    BackupConfig config;
    config.version = requireString(root, "version", "");
    checkVersion(config.version);

    config.backupDir = requireString(root, "backup-dir", "");
    if (config.backupDir.empty() || config.backupDir[0] != '/') {
        throw ConfigurationError("'backup-dir' must be an absolute path");
    }
    while (config.backupDir.size() > 1 && config.backupDir.back() == '/') {
        config.backupDir.pop_back();
    }

    if (root.contains("log-level")) {
        std::string level = requireString(root, "log-level", "");
        if (!Logger::parseLogLevel(level, config.logLevel)) {
            throw ConfigurationError("Unknown log level '" + level + "'");
        }
    }

    auto sets = root.find("backup-sets");
    if (sets == root.end()) {
        throw ConfigurationError("Missing configuration parameter 'backup-sets'");
    }
    if (!sets->is_array()) {
        throw ConfigurationError("'backup-sets' must be an array");
    }
    std::set<std::string> seen;
    for (const auto& node : *sets) {
        config.backupSets.push_back(parseBackupSet(node, seen));
    }
    return config;
}

BackupConfig loadBackupConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Could not open configuration file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw ConfigurationError("Could not read configuration file '" + path + "'");
    }
    return parseBackupConfig(buffer.str());
}

std::string describeSource(const SourceLocator& source) {
    if (const auto* local = std::get_if<LocalSource>(&source)) {
        return local->path;
    }
    const auto& remote = std::get<RemoteSource>(source);
    return remote.host + ":" + remote.path + " (via '" + remote.shell + "')";
}

void printConfigurationFormat() {
    std::cout <<
        "The configuration for the backup program is stored in a JSON-file.\n"
        "The file is versioned. This version of the program uses version\n"
        "2.0 of the configuration file. It is also compatible with any other\n"
        "2.x version of the configuration file.\n"
        "\n"
        "A sample configuration file looks as follows:\n"
        "\n"
        "    {\n"
        "       \"version\": \"2.0\",\n"
        "       \"backup-dir\": \"/path/to/backup/dir\",\n"
        "       \"log-level\": \"info\",\n"
        "       \"backup-sets\": [\n"
        "          {\n"
        "             \"set-name\": \"set_1\",\n"
        "             \"type\": \"local dir\",\n"
        "             \"source-dir\": \"/path/to/source_1\",\n"
        "             \"skip-entries\": [ \"entry_1\", \"entry_2\" ]\n"
        "          },\n"
        "          {\n"
        "             \"set-name\": \"set_2\",\n"
        "             \"type\": \"remote dir\",\n"
        "             \"remote-shell\": \"ssh -l user\",\n"
        "             \"remote-host\": \"server_name\",\n"
        "             \"source-dir\": \"/path/to/source_2\"\n"
        "          }\n"
        "       ]\n"
        "    }\n"
        "\n"
        "Top level name/value pairs:\n"
        "- `version`    : \"2.0\" (any \"2.x\" is accepted).\n"
        "- `backup-dir` : Absolute base directory of the backups. It must exist\n"
        "                 before the program runs.\n"
        "- `log-level`  : (optional) debug, info, warning or error.\n"
        "- `backup-sets`: An array of backup sets.\n"
        "\n"
        "Backup set name/value pairs:\n"
        "- `set-name`    : Name of the set, used as subdirectory of the run.\n"
        "- `type`        : 'local dir' or 'remote dir'.\n"
        "- `remote-shell`: ('remote dir' only) Command, with options, used to\n"
        "                  reach the remote host.\n"
        "- `remote-host` : ('remote dir' only) Host to connect to, optionally\n"
        "                  as <user>@<host>.\n"
        "- `source-dir`  : Absolute path of the directory to back up.\n"
        "- `skip-entries`: (optional) File and directory names that are skipped\n"
        "                  wherever they appear below the source directory.\n"
        "\n"
        "Each set is backed up to `backup-dir`/<timestamp>/`set-name`, where the\n"
        "timestamp is fixed when the program starts. Unchanged files are hard\n"
        "links into the previous backup of the same set.\n";
}
