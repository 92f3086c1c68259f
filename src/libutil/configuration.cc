#include "lbrun/util/configuration.hh"
#include "lbrun/util/file-system.hh"
#include "lbrun/util/logging.hh"
#include "lbrun/util/strings.hh"
#include "lbrun/util/util.hh"

#include <utility>
#include <vector>

namespace lbrun {

AbstractSetting::AbstractSetting(const std::string & name, std::string_view description)
    : name(name)
    , description(trim(stripIndentation(description), "\n") + "\n")
{
}

template<typename T>
T Setting<T>::parse(const std::string & str) const
{
    if (auto n = string2Int<T>(str))
        return *n;
    throw UsageError("setting '%s' requires a non-negative integer, got '%s'", name, str);
}

template<typename T>
std::string Setting<T>::to_string() const
{
    return std::to_string(value);
}

template<>
std::string Setting<std::string>::parse(const std::string & str) const
{
    return str;
}

template<>
std::string Setting<std::string>::to_string() const
{
    return value;
}

template<>
bool Setting<bool>::parse(const std::string & str) const
{
    if (str == "true" || str == "yes" || str == "1")
        return true;
    if (str == "false" || str == "no" || str == "0")
        return false;
    throw UsageError("setting '%s' requires a Boolean, got '%s'", name, str);
}

template<>
std::string Setting<bool>::to_string() const
{
    return value ? "true" : "false";
}

template class Setting<std::string>;
template class Setting<bool>;
template class Setting<unsigned long>;

PathSetting::PathSetting(Config * config, const Path & def, const std::string & name, std::string_view description)
    : Setting<Path>(config, def, name, description)
{
}

Path PathSetting::parse(const std::string & str) const
{
    if (str.empty())
        throw UsageError("setting '%s' requires a path", name);
    return canonPath(str);
}

void Config::addSetting(AbstractSetting * setting)
{
    settings.emplace(setting->name, setting);
}

bool Config::set(const std::string & name, const std::string & value)
{
    auto i = settings.find(name);
    if (i == settings.end())
        return false;
    i->second->set(value);
    i->second->overridden = true;
    return true;
}

static void parseConfig(
    const std::string & contents, const Path & path, std::vector<std::pair<std::string, std::string>> & assignments)
{
    for (auto & rawLine : tokenizeString<std::vector<std::string>>(contents, "\n")) {
        auto line = rawLine.substr(0, rawLine.find('#'));
        auto tokens = tokenizeString<std::vector<std::string>>(line);
        if (tokens.empty())
            continue;

        if (tokens[0] == "include" || tokens[0] == "!include") {
            if (tokens.size() != 2)
                throw UsageError("'%s' in '%s' takes exactly one file name", tokens[0], path);
            auto included = absPath(tokens[1], dirOf(path));
            if (pathExists(included))
                parseConfig(readFile(included), included, assignments);
            else if (tokens[0] == "include")
                throw Error("file '%s' included from '%s' does not exist", included, path);
            continue;
        }

        if (tokens.size() < 3 || tokens[1] != "=")
            throw UsageError("syntax error in configuration line '%s' in '%s'", trim(line), path);

        assignments.emplace_back(tokens[0], concatStringsSep(" ", std::vector<std::string>(tokens.begin() + 2, tokens.end())));
    }
}

void Config::applyConfig(const std::string & contents, const std::string & path)
{
    /* Parse everything first so that a syntax error leaves the
       settings untouched. */
    std::vector<std::pair<std::string, std::string>> assignments;
    parseConfig(contents, path, assignments);

    for (auto & [name, value] : assignments)
        if (!set(name, value))
            unknownSettings.insert_or_assign(name, value);
}

void Config::warnUnknownSettings() const
{
    for (auto & [name, value] : unknownSettings)
        warn("unknown setting '%s'", name);
}

void Config::resetOverridden()
{
    for (auto & [name, setting] : settings)
        setting->overridden = false;
}

nlohmann::json Config::toJSON() const
{
    auto res = nlohmann::json::object();
    for (auto & [name, setting] : settings)
        res[name] = setting->toJSON();
    return res;
}

std::string Config::toKeyValue() const
{
    std::string res;
    for (auto & [name, setting] : settings)
        res += fmt("%s = %s\n", name, setting->to_string());
    return res;
}

} // namespace lbrun
