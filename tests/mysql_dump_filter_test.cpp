#include "database_adapters.hpp"

#include <gtest/gtest.h>

namespace {

std::vector<std::string> run(MySqlDumpFilter& filter, const std::vector<std::string>& lines) {
    std::vector<std::string> out;
    for (const auto& line : lines) {
        if (auto kept = filter.apply(line)) {
            out.push_back(*kept);
        }
    }
    return out;
}

const std::vector<std::string> kTwoDatabaseDump{
    "-- Current Database: `shop`",
    "CREATE DATABASE /*!32312 IF NOT EXISTS*/ `shop` /*!40100 DEFAULT CHARACTER SET utf8mb4 */;",
    "USE `shop`;",
    "CREATE TABLE `orders` (`id` int);",
    "-- Current Database: `crm`",
    "CREATE DATABASE /*!32312 IF NOT EXISTS*/ `crm`;",
    "USE `crm`;",
    "CREATE TABLE `contacts` (`id` int);",
};

} // namespace

TEST(SafeDatabaseNameTest, AcceptsIdentifiersOnly) {
    EXPECT_TRUE(isSafeDatabaseName("shop_2024"));
    EXPECT_TRUE(isSafeDatabaseName("tenant-a$1"));
    EXPECT_FALSE(isSafeDatabaseName(""));
    EXPECT_FALSE(isSafeDatabaseName("shop; DROP DATABASE x"));
    EXPECT_FALSE(isSafeDatabaseName("a`b"));
    EXPECT_FALSE(isSafeDatabaseName(std::string(65, 'a')));
}

TEST(MySqlDumpFilterTest, PassesEverythingWithoutMappingOrTarget) {
    MySqlDumpFilter filter({}, std::nullopt);
    EXPECT_TRUE(filter.passthrough());
    EXPECT_EQ(run(filter, kTwoDatabaseDump), kTwoDatabaseDump);
}

TEST(MySqlDumpFilterTest, TargetOnlyDropsDatabaseSwitches) {
    MySqlDumpFilter filter({}, std::string("staging"));
    EXPECT_FALSE(filter.passthrough());

    auto out = run(filter, kTwoDatabaseDump);
    EXPECT_EQ(out, (std::vector<std::string>{
                       "-- Current Database: `shop`",
                       "CREATE TABLE `orders` (`id` int);",
                       "-- Current Database: `crm`",
                       "CREATE TABLE `contacts` (`id` int);",
                   }));
}

TEST(MySqlDumpFilterTest, RenamesSelectedAndDropsUnselectedSections) {
    MySqlDumpFilter filter({{"shop", "shop_restored", true}, {"crm", "", false}}, std::nullopt);

    auto out = run(filter, kTwoDatabaseDump);
    EXPECT_EQ(out, (std::vector<std::string>{
                       "-- Current Database: `shop`",
                       "CREATE DATABASE /*!32312 IF NOT EXISTS*/ `shop_restored` /*!40100 DEFAULT CHARACTER SET utf8mb4 */;",
                       "USE `shop_restored`;",
                       "CREATE TABLE `orders` (`id` int);",
                       "-- Current Database: `crm`",
                   }));
}

TEST(MySqlDumpFilterTest, UnmappedDatabasesPassUnchanged) {
    MySqlDumpFilter filter({{"crm", "", false}}, std::nullopt);

    std::vector<std::string> dump{
        "USE `crm`;",
        "INSERT INTO `contacts` VALUES (1);",
        "USE `audit`;",
        "INSERT INTO `events` VALUES (1);",
    };
    EXPECT_EQ(run(filter, dump), (std::vector<std::string>{"USE `audit`;", "INSERT INTO `events` VALUES (1);"}));
}

TEST(MySqlDumpFilterTest, EmptyTargetKeepsTheOriginalName) {
    MySqlDumpFilter filter({{"shop", "", true}}, std::nullopt);
    EXPECT_EQ(filter.apply("USE `shop`;"), "USE `shop`;");
    EXPECT_EQ(filter.apply("CREATE DATABASE IF NOT EXISTS `shop`;"), "CREATE DATABASE IF NOT EXISTS `shop`;");
}
