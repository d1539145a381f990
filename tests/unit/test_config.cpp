#include "routecore/common/Config.h"
#include "routecore/common/Logger.h"

#include <cassert>
#include <string>

using routecore::common::Config;

static void testParse() {
    Config conf;
    assert(conf.LoadFromString(
        "top = 1\n"
        "# comment\n"
        "; another comment\n"
        "[router]\n"
        "  strategy   =  least-busy  \n"
        "max_retries = 4\n"
        "cooldown_sec = 2.5\n"
        "broken = abc\n"
        "enabled = yes\n"
        "no_equals_line\n"
        "[deployment:a]\n"
        "model = gpt\n"
        "[deployment:b]\n"
        "model = claude\n"));

    assert(conf.GetString("global", "top") == "1");
    assert(conf.GetString("router", "strategy") == "least-busy");
    assert(conf.GetInt("router", "max_retries", 0) == 4);
    assert(conf.GetDouble("router", "cooldown_sec", 0.0) == 2.5);
    assert(conf.GetInt("router", "broken", 7) == 7);
    assert(conf.GetDouble("router", "broken", 1.5) == 1.5);
    assert(conf.GetBool("router", "enabled", false));
    assert(conf.GetBool("router", "missing", true));
    assert(conf.GetString("router", "missing", "dflt") == "dflt");
    assert(conf.HasSection("router"));
    assert(!conf.HasSection("pool"));

    const auto deployments = conf.GetSectionsWithPrefix("deployment:");
    assert(deployments.size() == 2);
    assert(deployments[0].first == "deployment:a");
    assert(deployments[0].second.at("model") == "gpt");
    assert(deployments[1].first == "deployment:b");
}

static void testReloadReplaces() {
    Config conf;
    assert(conf.LoadFromString("[a]\nx = 1\n"));
    assert(conf.LoadFromString("[b]\ny = 2\n"));
    assert(!conf.HasSection("a"));
    assert(conf.GetInt("b", "y", 0) == 2);

    conf.SetString("a", "x", "3");
    assert(conf.GetInt("a", "x", 0) == 3);
    assert(conf.GetAll().size() == 2);
}

static void testMissingFile() {
    Config conf;
    assert(!conf.Load("/nonexistent/routecore.conf"));
    assert(!conf.LoadedFilename());
}

int main() {
    routecore::common::Logger::Instance().SetLevel(routecore::common::LogLevel::FATAL);
    testParse();
    testReloadReplaces();
    testMissingFile();
    return 0;
}
