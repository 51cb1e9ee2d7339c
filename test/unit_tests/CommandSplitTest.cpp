#include "CommandSplit.hpp"
#include "TestHeaders.hpp"

using namespace ld;

TEST_CASE("Whitespace separates arguments", "[CommandSplit]") {
  REQUIRE(splitCommandLine("ls  -al\t/tmp ") ==
          vector<string>({"ls", "-al", "/tmp"}));
  REQUIRE(splitCommandLine("   ").empty());
}

TEST_CASE("Quotes group arguments", "[CommandSplit]") {
  REQUIRE(splitCommandLine("echo 'a b' \"c d\"") ==
          vector<string>({"echo", "a b", "c d"}));
  REQUIRE(splitCommandLine("grep -e 'it'\"'\"'s' f") ==
          vector<string>({"grep", "-e", "it's", "f"}));
  REQUIRE(splitCommandLine("echo ''") == vector<string>({"echo", ""}));
  REQUIRE(splitCommandLine("echo '$HOME \\n'") ==
          vector<string>({"echo", "$HOME \\n"}));
}

TEST_CASE("Backslash escapes", "[CommandSplit]") {
  REQUIRE(splitCommandLine("cat my\\ file") ==
          vector<string>({"cat", "my file"}));
  REQUIRE(splitCommandLine("echo \"say \\\"hi\\\" \\n\"") ==
          vector<string>({"echo", "say \"hi\" \\n"}));
}

TEST_CASE("Unbalanced input is rejected", "[CommandSplit]") {
  REQUIRE_THROWS_WITH(splitCommandLine("echo 'oops"), "No closing quotation");
  REQUIRE_THROWS_WITH(splitCommandLine("echo \"oops"), "No closing quotation");
  REQUIRE_THROWS_WITH(splitCommandLine("echo oops\\"), "No escaped character");
}

TEST_CASE("Quoted arguments split back unchanged", "[CommandSplit]") {
  REQUIRE(quoteShellArgument("/var/log") == "/var/log");
  REQUIRE(quoteShellArgument("/data/My Dir") == "'/data/My Dir'");
  REQUIRE(quoteShellArgument("") == "''");

  REQUIRE(splitCommandLine("ls -al " + quoteShellArgument("/data/My Dir")) ==
          vector<string>({"ls", "-al", "/data/My Dir"}));
  REQUIRE(splitCommandLine("ls -al " + quoteShellArgument("/srv/it's")) ==
          vector<string>({"ls", "-al", "/srv/it's"}));
  REQUIRE(splitCommandLine("ls " + quoteShellArgument("a\\b \"c\" $d")) ==
          vector<string>({"ls", "a\\b \"c\" $d"}));
}
