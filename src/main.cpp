#include "topomerge/common/logging.hpp"
#include "topomerge/report/topology.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace topomerge;

namespace
{

EdgeMetadata traffic(std::uint64_t egress_packets, std::uint64_t egress_bytes, std::uint64_t max_conn)
{
    EdgeMetadata emd;
    emd.egress_packet_count = egress_packets;
    emd.egress_byte_count = egress_bytes;
    emd.max_conn_count_tcp = max_conn;
    return emd;
}

/// Report from a probe on host "web": sees web -> db.
Topology web_probe_report()
{
    const DefaultIdCodec& codec = DefaultIdCodec::instance();
    const std::string web = make_node_id("web", "process");
    const std::string db = make_node_id("db", "process");
    return make_topology()
        .with_node(web, make_node_metadata_with({{"role", "frontend"}}).with_adjacent(db))
        .with_node(db, make_node_metadata_with({{"role", "database"}}))
        .with_edge(web, db, traffic(120, 64000, 4), codec);
}

/// Report from a probe on host "db": sees the same edge in a later window.
Topology db_probe_report()
{
    const DefaultIdCodec& codec = DefaultIdCodec::instance();
    const std::string web = make_node_id("web", "process");
    const std::string db = make_node_id("db", "process");
    return make_topology()
        .with_node(db, make_node_metadata_with({{"role", "database"}, {"engine", "postgres"}})
                           .with_counters({{"connections", 3}}))
        .with_node(web, make_node_metadata().with_adjacent(db))
        .with_edge(web, db, traffic(80, 41000, 6), codec);
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        auto logger = logging::init();
        logger->info("====== topomerge ======");

        const Topology a = web_probe_report();
        const Topology b = db_probe_report();
        const Topology ab = a.merge(b);
        const Topology ba = b.merge(a);

        logger->info("merged {} node(s), {} edge(s)",
            ab.node_metadatas().size(), ab.edge_metadatas().size());

        bool ok = true;
        if (ab.edge_metadatas() != ba.edge_metadatas())
        {
            logger->error("edge metadata did not converge across merge orders");
            ok = false;
        }
        if (ab.merge(ab).node_metadatas() != ab.node_metadatas())
        {
            logger->error("node metadata merge is not idempotent");
            ok = false;
        }

        const TopologyDiagnostics diagnostics = ab.validate();
        logging::log_diagnostics(diagnostics);
        ok = ok && diagnostics.is_valid();

        logger->info(ok ? "====== normal exit ======" : "====== abnormal exit ======");
        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
}
