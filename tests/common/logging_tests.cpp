#include <gtest/gtest.h>
#include "topomerge/common/logging.hpp"
#include "topomerge/report/topology.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <sstream>

using namespace topomerge;

class LoggingTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        LoggingConfig config;
        config.level = spdlog::level::info;
        config.pattern = "%l %v";
        config.read_env_level = false;
        m_logger = logging::init(config);

        m_sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(m_out);
        m_sink->set_pattern("%l %v");
        m_logger->sinks().push_back(m_sink);
    }

    void TearDown() override
    {
        auto& sinks = m_logger->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), m_sink), sinks.end());
    }

    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> m_sink;
    std::ostringstream m_out;
};

TEST_F(LoggingTests, Get_ReturnsRegisteredLogger)
{
    EXPECT_EQ(logging::get(), m_logger);
    EXPECT_EQ(m_logger->name(), logging::logger_name);
}

TEST_F(LoggingTests, Init_AppliesLevel)
{
    LoggingConfig config;
    config.level = spdlog::level::err;
    config.read_env_level = false;
    logging::init(config);
    EXPECT_EQ(m_logger->level(), spdlog::level::err);
}

TEST_F(LoggingTests, LogDiagnostics_ValidTopology)
{
    logging::log_diagnostics(make_topology().validate());
    m_logger->flush();
    EXPECT_NE(m_out.str().find("info topology is consistent"), std::string::npos);
}

TEST_F(LoggingTests, LogDiagnostics_OneLinePerViolation)
{
    Topology t = make_topology()
        .with_node("A", make_node_metadata().with_adjacent("B"))
        .with_node("host;", make_node_metadata());
    logging::log_diagnostics(t.validate());
    m_logger->flush();

    const std::string out = m_out.str();
    EXPECT_NE(out.find("warning topology has 3 violation(s)"), std::string::npos);
    EXPECT_NE(out.find("[missing-adjacent-node]"), std::string::npos);
    EXPECT_NE(out.find("[missing-edge]"), std::string::npos);
    EXPECT_NE(out.find("[invalid-node-id]"), std::string::npos);
}
