#pragma once
///@file

#include "lbrun/util/types.hh"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>

namespace lbrun {

class Config;

/**
 * A named, documented setting of a `Config`, settable from its string
 * form as written in `lbrun.conf` or given to `--option`.
 */
class AbstractSetting
{
public:
    const std::string name;
    const std::string description;

    /**
     * Whether the value was set from a configuration file or the
     * command line.
     */
    bool overridden = false;

    AbstractSetting(const AbstractSetting &) = delete;
    virtual ~AbstractSetting() = default;

    /**
     * Throws `UsageError` if `str` is not a valid value.
     */
    virtual void set(const std::string & str) = 0;

    virtual std::string to_string() const = 0;

    virtual nlohmann::json toJSON() const = 0;

protected:
    AbstractSetting(const std::string & name, std::string_view description);
};

template<typename T>
class Setting : public AbstractSetting
{
protected:
    T value;
    const T defaultValue;

    virtual T parse(const std::string & str) const;

public:
    Setting(Config * config, const T & def, const std::string & name, std::string_view description);

    const T & get() const
    {
        return value;
    }

    operator const T &() const
    {
        return value;
    }

    void operator=(const T & v)
    {
        value = v;
    }

    void override(const T & v)
    {
        value = v;
        overridden = true;
    }

    void set(const std::string & str) override
    {
        value = parse(str);
    }

    std::string to_string() const override;

    nlohmann::json toJSON() const override
    {
        return {{"value", value}, {"defaultValue", defaultValue}, {"description", description}};
    }
};

template<>
std::string Setting<std::string>::parse(const std::string & str) const;
template<>
std::string Setting<std::string>::to_string() const;
template<>
bool Setting<bool>::parse(const std::string & str) const;
template<>
std::string Setting<bool>::to_string() const;

extern template class Setting<std::string>;
extern template class Setting<bool>;
extern template class Setting<unsigned long>;

/**
 * A non-empty path, canonicalised when set (e.g. "/foo//bar/" becomes
 * "/foo/bar").
 */
class PathSetting : public Setting<Path>
{
public:
    PathSetting(Config * config, const Path & def, const std::string & name, std::string_view description);

    using Setting<Path>::operator=;

protected:
    Path parse(const std::string & str) const override;
};

/**
 * A set of settings, filled in by `Setting` members of a subclass:
 *
 *   struct MySettings : Config
 *   {
 *       Setting<std::string> user{this, "root", "sandbox-user", "The user running build steps."};
 *   };
 */
class Config
{
    std::map<std::string, AbstractSetting *> settings;

    /**
     * Names assigned by `applyConfig()` that no setting answers to.
     */
    StringMap unknownSettings;

public:
    Config() = default;
    Config(const Config &) = delete;
    virtual ~Config() = default;

    void addSetting(AbstractSetting * setting);

    /**
     * Set the setting called `name`. Returns false if there is none.
     */
    bool set(const std::string & name, const std::string & value);

    /**
     * Apply `name = value` lines. `#` starts a comment, and
     * `include FILE` / `!include FILE` read another file relative to
     * `path`, the latter only if it exists. Throws `UsageError` on
     * malformed lines.
     */
    void applyConfig(const std::string & contents, const std::string & path = "<unknown>");

    void warnUnknownSettings() const;

    void resetOverridden();

    /**
     * `{ name: { value, defaultValue, description } }` for every
     * setting.
     */
    nlohmann::json toJSON() const;

    /**
     * Every setting as a `name = value` line, sorted by name, in the
     * format `applyConfig()` reads.
     */
    std::string toKeyValue() const;
};

template<typename T>
Setting<T>::Setting(Config * config, const T & def, const std::string & name, std::string_view description)
    : AbstractSetting(name, description)
    , value(def)
    , defaultValue(def)
{
    config->addSetting(this);
}

} // namespace lbrun
