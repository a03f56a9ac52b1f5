#include <gtest/gtest.h>
#include <logger_builder.h>
#include <logger_guardant.h>
#include <string>
#include <vector>

namespace {

class counting_logger final:
    public logger
{
public:

    std::vector<logger::severity> severities;

    [[nodiscard]] logger &log(
        const std::string &,
        logger::severity severity) & override
    {
        severities.push_back(severity);
        return *this;
    }

    static std::string format(
        std::string const &pattern,
        std::string const &message,
        logger::severity severity)
    {
        return format_message(pattern, message, severity);
    }
};

class guarded final:
    public logger_guardant
{
private:

    logger *_logger;

public:

    explicit guarded(logger *logger)
        : _logger(logger)
    {

    }

private:

    [[nodiscard]] logger *get_logger() const override
    {
        return _logger;
    }
};

}

TEST(loggerPositiveTests, test1)
{
    EXPECT_EQ(logger_builder::string_to_severity("trace"), logger::severity::trace);
    EXPECT_EQ(logger_builder::string_to_severity("DEBUG"), logger::severity::debug);
    EXPECT_EQ(logger_builder::string_to_severity("information"), logger::severity::information);
    EXPECT_EQ(logger_builder::string_to_severity("INFO"), logger::severity::information);
    EXPECT_EQ(logger_builder::string_to_severity("Warning"), logger::severity::warning);
    EXPECT_EQ(logger_builder::string_to_severity("error"), logger::severity::error);
    EXPECT_EQ(logger_builder::string_to_severity("CRITICAL"), logger::severity::critical);
}

TEST(loggerPositiveTests, test2)
{
    counting_logger log;
    log.trace("a").debug("b").information("c").warning("d").error("e").critical("f");

    EXPECT_EQ(log.severities, (std::vector<logger::severity>{
        logger::severity::trace, logger::severity::debug, logger::severity::information,
        logger::severity::warning, logger::severity::error, logger::severity::critical}));
}

TEST(loggerPositiveTests, test3)
{
    counting_logger log;
    guarded with_logger(&log);
    guarded without_logger(nullptr);

    with_logger.information_with_guard("x")->error_with_guard("y");
    without_logger.error_with_guard("ignored");

    EXPECT_EQ(log.severities, (std::vector<logger::severity>{logger::severity::information, logger::severity::error}));
}

TEST(loggerPositiveTests, test4)
{
    EXPECT_EQ(counting_logger::format("[%s] %m %q", "hello", logger::severity::warning), "[WARNING] hello %q");
    EXPECT_EQ(counting_logger::format("%m%", "tail", logger::severity::debug), "tail%");
    EXPECT_EQ(counting_logger::format("%s", "", logger::severity::information), "INFO");

    auto const stamped = counting_logger::format("%d %t", "", logger::severity::trace);
    ASSERT_EQ(stamped.size(), 19u);
    EXPECT_EQ(stamped[4], '-');
    EXPECT_EQ(stamped[10], ' ');
    EXPECT_EQ(stamped[13], ':');
}

TEST(loggerNegativeTests, test1)
{
    EXPECT_THROW(logger_builder::string_to_severity("verbose"), std::out_of_range);
}

int main(
    int argc,
    char **argv)
{
    testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}
