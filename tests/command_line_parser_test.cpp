#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "command_line_parser.h"

namespace rls {
namespace {

Config Parse(const std::vector<std::string>& args) {
    return CommandLineParser().ParseArguments(args);
}

TEST(CommandLineParserTest, DefaultsListCurrentDirectoryByName) {
    const Config config = Parse({});
    EXPECT_EQ(config.path(), ".");
    EXPECT_EQ(config.filter(), Config::Filter::All);
    EXPECT_EQ(config.sort_field(), SortField::Name);
    EXPECT_FALSE(config.reverse());
    EXPECT_EQ(config.max_columns(), 4u);
    EXPECT_EQ(config.width(), Config::kDefaultWidth);
    EXPECT_EQ(config.log_level(), Logger::Level::Error);
    EXPECT_FALSE(config.no_colour());
    EXPECT_FALSE(config.no_running());
}

TEST(CommandLineParserTest, AttributeFlagsSelectDetail) {
    const Config config = Parse({"-c", "-M", "-n", "-S", "-e", "some/dir"});
    EXPECT_EQ(config.path(), "some/dir");
    EXPECT_EQ(config.creation_time(), Config::Detail::Short);
    EXPECT_EQ(config.modification_time(), Config::Detail::Long);
    EXPECT_EQ(config.sub_counts(), Config::Detail::Short);
    EXPECT_EQ(config.size(), Config::Detail::Long);
    EXPECT_TRUE(config.highlight_extensions());
    EXPECT_EQ(config.display_column_count(), 6u);
}

TEST(CommandLineParserTest, ShortAndLongFormsExcludeEachOther) {
    EXPECT_THROW(Parse({"-s", "-S"}), CLI::ParseError);
    EXPECT_THROW(Parse({"-f", "-d"}), CLI::ParseError);
    EXPECT_THROW(Parse({"-x", "-X"}), CLI::ParseError);
}

TEST(CommandLineParserTest, ExplicitSortKeys) {
    EXPECT_EQ(Parse({"-x", "c"}).sort_field(), SortField::CreationTime);
    EXPECT_EQ(Parse({"--sort", "nf"}).sort_field(), SortField::SubfileCount);
    EXPECT_EQ(Parse({"--sort=e"}).sort_field(), SortField::Extension);

    const Config reversed = Parse({"-X", "nd", "path"});
    EXPECT_EQ(reversed.sort_field(), SortField::SubdirCount);
    EXPECT_TRUE(reversed.reverse());
    EXPECT_EQ(reversed.path(), "path");
}

TEST(CommandLineParserTest, InvalidSortKeyIsRejected) {
    EXPECT_THROW(Parse({"--sort=size"}), CLI::ParseError);
}

TEST(CommandLineParserTest, BareSortFlagLeavesPathAlone) {
    const Config config = Parse({"-x", "dir"});
    EXPECT_EQ(config.path(), "dir");
    EXPECT_EQ(config.sort_field(), SortField::Name);
}

TEST(CommandLineParserTest, SortKeyIsInferredFromSingleAttribute) {
    EXPECT_EQ(Parse({"-s", "-x"}).sort_field(), SortField::Size);
    EXPECT_EQ(Parse({"-M", "-x"}).sort_field(), SortField::ModificationTime);
    EXPECT_EQ(Parse({"-e", "-x"}).sort_field(), SortField::Extension);

    const Config reversed = Parse({"-C", "-X"});
    EXPECT_EQ(reversed.sort_field(), SortField::CreationTime);
    EXPECT_TRUE(reversed.reverse());
}

TEST(CommandLineParserTest, InferenceFailsWithSeveralAttributes) {
    EXPECT_THROW(Parse({"-c", "-s", "-x"}), CLI::ValidationError);
    EXPECT_THROW(Parse({"-n", "-x"}), CLI::ValidationError);
}

TEST(CommandLineParserTest, SortKeyInsideShortFlagCluster) {
    const Config by_size = Parse({"-xs"});
    EXPECT_EQ(by_size.sort_field(), SortField::Size);
    EXPECT_EQ(by_size.size(), Config::Detail::Hidden);

    const Config reversed = Parse({"-Xnf", "dir"});
    EXPECT_EQ(reversed.sort_field(), SortField::SubfileCount);
    EXPECT_TRUE(reversed.reverse());
    EXPECT_EQ(reversed.path(), "dir");
}

TEST(CommandLineParserTest, SortFlagEndingClusterInfersOrTakesKey) {
    const Config inferred = Parse({"-sx"});
    EXPECT_EQ(inferred.size(), Config::Detail::Short);
    EXPECT_EQ(inferred.sort_field(), SortField::Size);

    const Config explicit_key = Parse({"-fX", "m"});
    EXPECT_EQ(explicit_key.filter(), Config::Filter::FilesOnly);
    EXPECT_EQ(explicit_key.sort_field(), SortField::ModificationTime);
    EXPECT_TRUE(explicit_key.reverse());
}

TEST(CommandLineParserTest, LettersAfterSortFlagThatAreNoKeyAreFlags) {
    const Config config = Parse({"-xM"});
    EXPECT_EQ(config.modification_time(), Config::Detail::Long);
    EXPECT_EQ(config.sort_field(), SortField::ModificationTime);

    EXPECT_THROW(Parse({"-xse"}), CLI::ValidationError);
}

TEST(CommandLineParserTest, ExplicitKeyNeedsNoInference) {
    EXPECT_EQ(Parse({"-c", "-s", "-x", "s"}).sort_field(), SortField::Size);
}

TEST(CommandLineParserTest, ColumnCountDefaultsDependOnAttributes) {
    EXPECT_EQ(Parse({"-m"}).max_columns(), 1u);
    EXPECT_EQ(Parse({"-e"}).max_columns(), 1u);
    EXPECT_EQ(Parse({"--columns", "2"}).max_columns(), 2u);
    EXPECT_EQ(Parse({"-s", "--columns", "3"}).max_columns(), 3u);
    EXPECT_EQ(Parse({"-1"}).max_columns(), 1u);
}

TEST(CommandLineParserTest, LayoutAndDisplayFlags) {
    const Config config = Parse({"--row-wise", "--uniform-width", "--no-colour", "--no-running", "-w", "60"});
    EXPECT_TRUE(config.row_wise());
    EXPECT_TRUE(config.uniform_width());
    EXPECT_TRUE(config.no_colour());
    EXPECT_TRUE(config.no_running());
    EXPECT_EQ(config.width(), 60u);
}

TEST(CommandLineParserTest, NonPositiveCountsAreRejected) {
    EXPECT_THROW(Parse({"--columns", "0"}), CLI::ParseError);
    EXPECT_THROW(Parse({"--width", "0"}), CLI::ParseError);
}

TEST(CommandLineParserTest, DiagnosticsOptions) {
    const Config config = Parse({"--log-level", "DEBUG", "--perf-debug"});
    EXPECT_EQ(config.log_level(), Logger::Level::Debug);
    EXPECT_TRUE(config.perf_logging());
    EXPECT_EQ(Parse({"--log-level", "warning"}).log_level(), Logger::Level::Warn);
    EXPECT_THROW(Parse({"--log-level", "loud"}), CLI::ParseError);
}

TEST(ConfigTest, InferSortFieldWithoutAttributesIsName) {
    Config config;
    EXPECT_EQ(config.InferSortField(), SortField::Name);
    config.set_size(Config::Detail::Long);
    EXPECT_EQ(config.InferSortField(), SortField::Size);
    config.set_highlight_extensions(true);
    EXPECT_FALSE(config.InferSortField().has_value());
}

}  // namespace
}  // namespace rls
