#pragma once
///@file

#include <map>
#include <optional>

#include "fetchcache/util/types.hh"
#include "fetchcache/util/error.hh"

namespace fetchcache {

/**
 * The Config class provides fetchcache runtime configurations.
 *
 * What is a Configuration?
 *   A collection of uniquely named Settings.
 *
 * What is a Setting?
 *   Each property that you can set in a configuration corresponds to a
 *   `Setting`. A setting records value and description of a property
 *   with a default and optional aliases.
 *
 * A valid configuration consists of settings that are registered to a
 * `Config` object instance:
 *
 *   Config config;
 *   Setting<std::string> userAgent{&config, "", "user-agent-suffix", "appended to the User-Agent"};
 *
 * The above creates a `Config` object and registers a setting called
 * "user-agent-suffix" via the variable `userAgent` with it.
 */

class AbstractSetting;

class AbstractConfig
{
protected:
    StringMap unknownSettings;

    AbstractConfig(StringMap initials = {});

public:

    /**
     * Sets the value referenced by `name` to `value`. Returns true if the
     * setting is known, false otherwise.
     */
    virtual bool set(const std::string & name, const std::string & value) = 0;

    struct SettingInfo
    {
        std::string value;
        std::string description;
    };

    /**
     * Adds the currently known settings to the given result map `res`.
     * - res: map to store settings in
     * - overriddenOnly: when set to true only overridden settings will be added to `res`
     */
    virtual void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const = 0;

    /**
     * Parses the configuration in `contents` and applies it
     * - contents: configuration contents to be parsed and applied
     * - path: location of the configuration file
     */
    void applyConfig(const std::string & contents, const std::string & path = "<unknown>");

    /**
     * Resets the `overridden` flag of all Settings
     */
    virtual void resetOverridden() = 0;

    /**
     * Outputs all settings in a key-value pair format suitable to be used as
     * `fetchcache.conf`
     */
    virtual std::string toKeyValue() = 0;

    /**
     * Logs a warning for each unregistered setting
     */
    void warnUnknownSettings();

    virtual ~AbstractConfig() = default;
};

/**
 * A class to simplify providing configuration settings. The typical
 * use is to inherit Config and add Setting<T> members:
 *
 * class MyClass : private Config
 * {
 *   Setting<int> foo{this, 123, "foo", "the number of foos to use"};
 *   Setting<std::string> bar{this, "blabla", "bar", "the name of the bar"};
 * };
 */
class Config : public AbstractConfig
{
    friend class AbstractSetting;

public:

    struct SettingData
    {
        bool isAlias;
        AbstractSetting * setting;
    };

    using Settings = std::map<std::string, SettingData>;

private:

    Settings _settings;

public:

    Config(StringMap initials = {});

    bool set(const std::string & name, const std::string & value) override;

    void addSetting(AbstractSetting * setting);

    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const override;

    void resetOverridden() override;

    std::string toKeyValue() override;
};

class AbstractSetting
{
    friend class Config;

public:

    const std::string name;
    const std::string description;
    const StringSet aliases;

    bool overridden = false;

protected:

    AbstractSetting(const std::string & name, const std::string & description, const StringSet & aliases);

    virtual ~AbstractSetting();

    virtual void set(const std::string & value) = 0;

    virtual std::string to_string() const = 0;
};

/**
 * A setting of type T.
 */
template<typename T>
class BaseSetting : public AbstractSetting
{
protected:

    T value;

    /**
     * Parse the string into a `T`.
     *
     * Used by `set()`.
     */
    virtual T parse(const std::string & str) const;

public:

    BaseSetting(
        const T & def, const std::string & name, const std::string & description, const StringSet & aliases = {})
        : AbstractSetting(name, description, aliases)
        , value(def)
    {
    }

    operator const T &() const
    {
        return value;
    }

    operator T &()
    {
        return value;
    }

    const T & get() const
    {
        return value;
    }

    T & get()
    {
        return value;
    }

    template<typename U>
    bool operator==(const U & v2) const
    {
        return value == v2;
    }

    template<typename U>
    void operator=(const U & v)
    {
        assign(v);
    }

    virtual void assign(const T & v)
    {
        value = v;
    }

    void set(const std::string & str) override final
    {
        value = parse(str);
    }

    std::string to_string() const override;
};

template<typename T>
std::ostream & operator<<(std::ostream & str, const BaseSetting<T> & opt)
{
    return str << static_cast<const T &>(opt);
}

template<typename T>
class Setting : public BaseSetting<T>
{
public:
    Setting(
        Config * options,
        const T & def,
        const std::string & name,
        const std::string & description,
        const StringSet & aliases = {})
        : BaseSetting<T>(def, name, description, aliases)
    {
        options->addSetting(this);
    }

    void operator=(const T & v)
    {
        this->assign(v);
    }
};

/**
 * A special setting for Paths. These are automatically canonicalised
 * (e.g. "/foo//bar/" becomes "/foo/bar"). The empty string means the
 * setting is unset.
 */
class OptionalPathSetting : public BaseSetting<std::optional<Path>>
{
public:

    OptionalPathSetting(
        Config * options,
        const std::optional<Path> & def,
        const std::string & name,
        const std::string & description,
        const StringSet & aliases = {});

    std::optional<Path> parse(const std::string & str) const override;

    void operator=(const std::optional<Path> & v)
    {
        this->assign(v);
    }
};

#define DECLARE_CONFIG_SERIALISER(TY)                         \
    template<>                                                \
    TY BaseSetting<TY>::parse(const std::string & str) const; \
    template<>                                                \
    std::string BaseSetting<TY>::to_string() const;

DECLARE_CONFIG_SERIALISER(std::string)
DECLARE_CONFIG_SERIALISER(std::optional<std::string>)
DECLARE_CONFIG_SERIALISER(bool)

extern template class BaseSetting<int>;
extern template class BaseSetting<unsigned int>;
extern template class BaseSetting<long>;
extern template class BaseSetting<unsigned long>;
extern template class BaseSetting<long long>;
extern template class BaseSetting<unsigned long long>;
extern template class BaseSetting<bool>;
extern template class BaseSetting<std::string>;
extern template class BaseSetting<std::optional<std::string>>;

} // namespace fetchcache
