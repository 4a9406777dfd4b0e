// test_app_registry.cpp - Tests for the installed-application sources

#include "broom/app_registry.hpp"
#include "test_support.hpp"

using namespace Broom;

/**
 * @brief Fixed list, for composing.
 */
class ListRegistry : public AppRegistry {
public:
    explicit ListRegistry(std::vector<InstalledApp> apps) : apps_(std::move(apps)) {}
    std::vector<InstalledApp> installedApps() const override { return apps_; }
private:
    std::vector<InstalledApp> apps_;
};

static InstalledApp makeApp(const std::string& name, const std::string& identifier)
{
    InstalledApp app;
    app.name = name;
    app.identifier = identifier;
    return app;
}

// =============================================================================
// YAML catalog
// =============================================================================

void test_yaml_catalog_loads_apps()
{
    TempTree tree("registry_yaml");
    std::string catalog = tree.writeText("apps.yaml",
        "apps:\n"
        "  - name: Firefox\n"
        "    identifier: org.mozilla.firefox\n"
        "    path: /usr/bin/firefox\n"
        "    version: \"128.0\"\n"
        "    size: 2048\n"
        "  - name: Slack\n"
        "    identifier: com.slack.Slack\n"
        "  - name: Firefox again\n"
        "    identifier: ORG.mozilla.firefox\n");

    auto apps = YamlAppRegistry(catalog).installedApps();
    ASSERT_EQ(apps.size(), 2u);
    ASSERT_EQ(apps[0].name, "Firefox");
    ASSERT_EQ(apps[0].path, "/usr/bin/firefox");
    ASSERT(apps[0].version == std::string("128.0"));
    ASSERT_EQ(apps[0].sizeBytes, 2048u);
    ASSERT(apps[0].developerName() == std::string("mozilla"));
    ASSERT(!apps[1].version.has_value());
    ASSERT(!apps[1].id.empty());
}

void test_yaml_catalog_missing_is_empty()
{
    TempTree tree("registry_yaml_missing");
    ASSERT(YamlAppRegistry(tree.path("none.yaml")).installedApps().empty());
}

void test_yaml_catalog_rejects_bad_shape()
{
    TempTree tree("registry_yaml_bad");
    std::string notList = tree.writeText("a.yaml", "apps:\n  name: x\n");
    std::string noIdentifier = tree.writeText("b.yaml", "apps:\n  - name: x\n");
    std::string broken = tree.writeText("c.yaml", "apps: [\n");

    ASSERT_THROWS_KIND(YamlAppRegistry(notList).installedApps(), ErrorKind::InvalidInput);
    ASSERT_THROWS_KIND(YamlAppRegistry(noIdentifier).installedApps(), ErrorKind::InvalidInput);
    ASSERT_THROWS_KIND(YamlAppRegistry(broken).installedApps(), ErrorKind::InvalidInput);
}

// =============================================================================
// Desktop entries
// =============================================================================

void test_desktop_file_parsed()
{
    TempTree tree("registry_desktop");
    std::string program = tree.writeFile("bin/editor", 321);
    std::string file = tree.writeText("apps/org.example.Editor.desktop",
        "# comment\n"
        "[Desktop Entry]\n"
        "Type=Application\n"
        "Name=Editor\n"
        "Name[de]=Bearbeiter\n"
        "Exec=" + program + " %F\n"
        "X-AppVersion=2.1\n"
        "\n"
        "[Desktop Action new-window]\n"
        "Name=New Window\n");

    auto app = DesktopEntryRegistry::parseDesktopFile(file);
    ASSERT(app.has_value());
    ASSERT_EQ(app->name, "Editor");
    ASSERT_EQ(app->identifier, "org.example.Editor");
    ASSERT_EQ(app->path, program);
    ASSERT_EQ(app->sizeBytes, 321u);
    ASSERT(app->version == std::string("2.1"));
}

void test_desktop_file_without_absolute_exec()
{
    TempTree tree("registry_desktop_relative");
    std::string file = tree.writeText("apps/tool.desktop",
        "[Desktop Entry]\nName=Tool\nExec=tool --flag\n");

    auto app = DesktopEntryRegistry::parseDesktopFile(file);
    ASSERT(app.has_value());
    ASSERT_EQ(app->path, file);
    ASSERT_EQ(app->sizeBytes, 0u);
}

void test_desktop_file_rejections()
{
    TempTree tree("registry_desktop_reject");
    std::string hidden = tree.writeText("apps/a.desktop", "[Desktop Entry]\nName=A\nHidden=true\n");
    std::string link = tree.writeText("apps/b.desktop", "[Desktop Entry]\nType=Link\nName=B\n");
    std::string nameless = tree.writeText("apps/c.desktop", "[Desktop Entry]\nType=Application\n");

    ASSERT(!DesktopEntryRegistry::parseDesktopFile(hidden).has_value());
    ASSERT(!DesktopEntryRegistry::parseDesktopFile(link).has_value());
    ASSERT(!DesktopEntryRegistry::parseDesktopFile(nameless).has_value());
    ASSERT(!DesktopEntryRegistry::parseDesktopFile(tree.path("apps/missing.desktop")).has_value());
}

void test_first_directory_wins()
{
    TempTree tree("registry_desktop_dirs");
    tree.writeText("user/org.example.App.desktop", "[Desktop Entry]\nName=User Copy\n");
    tree.writeText("system/org.example.App.desktop", "[Desktop Entry]\nName=System Copy\n");
    tree.writeText("system/org.example.Other.desktop", "[Desktop Entry]\nName=Other\n");
    tree.writeText("system/notes.txt", "not an entry");

    DesktopEntryRegistry registry({tree.path("user"), tree.path("absent"), tree.path("system")});
    auto apps = registry.installedApps();
    ASSERT_EQ(apps.size(), 2u);
    ASSERT_EQ(apps[0].name, "User Copy");
    ASSERT_EQ(apps[1].identifier, "org.example.Other");
}

// =============================================================================
// Composite
// =============================================================================

void test_composite_dedupes_by_identifier()
{
    CompositeRegistry composite;
    ASSERT(composite.empty());
    composite.add(std::make_unique<ListRegistry>(std::vector<InstalledApp>{
        makeApp("First", "com.vendor.App")}));
    composite.add(std::make_unique<ListRegistry>(std::vector<InstalledApp>{
        makeApp("Second", "COM.VENDOR.APP"), makeApp("Third", "com.vendor.Other")}));
    composite.add(nullptr);

    auto apps = composite.installedApps();
    ASSERT(!composite.empty());
    ASSERT_EQ(apps.size(), 2u);
    ASSERT_EQ(apps[0].name, "First");
    ASSERT_EQ(apps[1].name, "Third");
}

int main()
{
    std::cout << "=== AppRegistry Tests ===\n\n";

    std::cout << "YAML Catalog Tests:\n";
    TEST(yaml_catalog_loads_apps);
    TEST(yaml_catalog_missing_is_empty);
    TEST(yaml_catalog_rejects_bad_shape);

    std::cout << "\nDesktop Entry Tests:\n";
    TEST(desktop_file_parsed);
    TEST(desktop_file_without_absolute_exec);
    TEST(desktop_file_rejections);
    TEST(first_directory_wins);

    std::cout << "\nComposite Tests:\n";
    TEST(composite_dedupes_by_identifier);

    TEST_SUMMARY();
    return (tests_passed == tests_run) ? 0 : 1;
}
