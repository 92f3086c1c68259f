#include "lbrun/util/configuration.hh"
#include "lbrun/util/file-system.hh"

#include <gtest/gtest.h>

namespace lbrun {

/* ----------------------------------------------------------------------------
 * Config
 * --------------------------------------------------------------------------*/

TEST(Config, setUndefinedSetting)
{
    Config config;
    ASSERT_EQ(config.set("undefined-key", "value"), false);
}

TEST(Config, setDefinedSetting)
{
    Config config;
    Setting<std::string> foo{&config, "", "name-of-the-setting", "description"};
    ASSERT_EQ(config.set("name-of-the-setting", "value"), true);
    ASSERT_EQ(foo.get(), "value");
    ASSERT_TRUE(foo.overridden);
}

TEST(Config, assignmentDoesNotMarkOverridden)
{
    Config config;
    Setting<std::string> user{&config, "root", "sandbox-user", "description"};

    user = "builder";
    ASSERT_EQ(user.get(), "builder");
    ASSERT_FALSE(user.overridden);
}

TEST(Config, resetOverriddenWithSetting)
{
    Config config;
    Setting<std::string> setting{&config, "", "name-of-the-setting", "description"};

    setting.override("bar");
    ASSERT_TRUE(setting.overridden);

    config.resetOverridden();
    ASSERT_FALSE(setting.overridden);
    ASSERT_EQ(setting.get(), "bar");
}

TEST(Config, boolSettings)
{
    Config config;
    Setting<bool> flag{&config, true, "require-iso-artifact", "description"};

    ASSERT_TRUE(config.set("require-iso-artifact", "false"));
    ASSERT_FALSE(flag.get());
    ASSERT_TRUE(config.set("require-iso-artifact", "yes"));
    ASSERT_TRUE(flag.get());
    ASSERT_THROW(config.set("require-iso-artifact", "maybe"), UsageError);
}

TEST(Config, integerSettings)
{
    Config config;
    Setting<unsigned long> timeout{&config, 0, "step-timeout", "description"};

    ASSERT_TRUE(config.set("step-timeout", "3600"));
    ASSERT_EQ(timeout.get(), 3600u);
    ASSERT_THROW(config.set("step-timeout", "an hour"), UsageError);
    ASSERT_THROW(config.set("step-timeout", "-1"), UsageError);
    ASSERT_EQ(timeout.get(), 3600u);
}

TEST(PathSetting, canonicalises)
{
    Config config;
    PathSetting dir{&config, "/tmp", "script-dir", "description"};

    ASSERT_TRUE(config.set("script-dir", "/var//lib/lbrun/"));
    ASSERT_EQ(dir.get(), "/var/lib/lbrun");
    ASSERT_THROW(config.set("script-dir", ""), UsageError);
}

TEST(Config, descriptionsLoseTheirIndentation)
{
    Config config;
    Setting<std::string> setting{&config, "root", "sandbox-user", R"(
          The user running
            build steps.
        )"};

    ASSERT_EQ(setting.description, "The user running\n  build steps.\n");
}

TEST(Config, toJSONOnDefinedSetting)
{
    Config config;
    Setting<std::string> setting{&config, "root", "sandbox-user", "description"};
    config.set("sandbox-user", "builder");

    auto json = config.toJSON();
    ASSERT_EQ(json["sandbox-user"]["value"], "builder");
    ASSERT_EQ(json["sandbox-user"]["defaultValue"], "root");
    ASSERT_EQ(json["sandbox-user"]["description"], "description\n");
}

TEST(Config, toKeyValue)
{
    Config config;
    Setting<std::string> user{&config, "root", "sandbox-user", "description"};
    Setting<bool> flag{&config, true, "print-build-logs", "description"};
    Setting<unsigned long> timeout{&config, 60, "step-timeout", "description"};

    ASSERT_EQ(config.toKeyValue(), "print-build-logs = true\nsandbox-user = root\nstep-timeout = 60\n");
}

/* ----------------------------------------------------------------------------
 * applyConfig
 * --------------------------------------------------------------------------*/

TEST(Config, applyConfigEmpty)
{
    Config config;
    Setting<std::string> user{&config, "root", "sandbox-user", "description"};

    config.applyConfig("");
    config.applyConfig("\n# only a comment\n\n");
    ASSERT_FALSE(user.overridden);
}

TEST(Config, applyConfigValues)
{
    Config config;
    Setting<std::string> user{&config, "root", "sandbox-user", "description"};
    Setting<unsigned long> timeout{&config, 0, "step-timeout", "description"};

    config.applyConfig(
        "# the build user\n"
        "sandbox-user = builder # trailing comment\n"
        "\n"
        "step-timeout = 7200\n"
        "unknown-setting = ignored\n");

    ASSERT_EQ(user.get(), "builder");
    ASSERT_EQ(timeout.get(), 7200u);
}

TEST(Config, applyConfigJoinsMultipleWords)
{
    Config config;
    Setting<std::string> program{&config, "", "program", "description"};

    config.applyConfig("program = sudo  schroot\n");
    ASSERT_EQ(program.get(), "sudo schroot");
}

TEST(Config, applyConfigSyntaxErrors)
{
    Config config;
    ASSERT_THROW(config.applyConfig("sandbox-user builder\n"), UsageError);
    ASSERT_THROW(config.applyConfig("lonely\n"), UsageError);
    ASSERT_THROW(config.applyConfig("sandbox-user =\n"), UsageError);
}

TEST(Config, applyConfigIsAllOrNothing)
{
    Config config;
    Setting<std::string> user{&config, "root", "sandbox-user", "description"};

    ASSERT_THROW(config.applyConfig("sandbox-user = builder\nbroken line\n"), UsageError);
    ASSERT_EQ(user.get(), "root");
}

TEST(Config, applyConfigIncludes)
{
    AutoDelete dir(createTempDir());
    auto confDir = dir.path().string();
    writeFile(confDir + "/timeouts.conf", "step-timeout = 60\n");

    Config config;
    Setting<unsigned long> timeout{&config, 0, "step-timeout", "description"};

    config.applyConfig("include timeouts.conf\n!include missing.conf\n", confDir + "/lbrun.conf");
    ASSERT_EQ(timeout.get(), 60u);

    ASSERT_THROW(config.applyConfig("include missing.conf\n", confDir + "/lbrun.conf"), Error);
    ASSERT_THROW(config.applyConfig("include\n", confDir + "/lbrun.conf"), UsageError);
}

} // namespace lbrun
