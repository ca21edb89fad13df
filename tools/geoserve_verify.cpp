#include <geoserve/db/generation.h>
#include <geoserve/net/ip_address.h>
#include <geoserve/server/json_writer.h>
#include <geoserve/storage/validator.h>

#include <iostream>
#include <string>

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        std::cerr << "Usage: geoserve_verify <file.mmdb> [ip ...]\n";
        return 2;
    }
    const std::string path = argv[1];

    // No ratio check against an active generation here; only the floor.
    geoserve::storage::Validator validator(geoserve::storage::ValidatorOptions{});
    auto md = validator.Inspect(path, std::nullopt);
    if (!md.ok())
    {
        std::cerr << "Verification failed: " << md.status().ToString() << "\n";
        return 1;
    }

    const auto &m = md.value();
    std::cout << "Database type: " << m.database_type << "\n";
    std::cout << "Format version: " << m.binary_format_major_version << "." << m.binary_format_minor_version << "\n";
    std::cout << "Build epoch: " << m.build_epoch << "\n";
    std::cout << "IP version: " << m.ip_version << "\n";
    std::cout << "Record size: " << m.record_size << "\n";
    std::cout << "Node count: " << m.node_count << "\n";
    std::cout << "Data section: " << m.data_section_size << " bytes\n";

    if (argc == 2)
        return 0;

    auto gen = geoserve::db::Generation::Open(path);
    if (!gen.ok())
    {
        std::cerr << "Open failed: " << gen.status().ToString() << "\n";
        return 1;
    }

    int rc = 0;
    for (int i = 2; i < argc; ++i)
    {
        const std::string text = argv[i];
        auto ip = geoserve::net::IpAddress::Parse(text);
        if (!ip.ok())
        {
            std::cout << text << ": invalid address\n";
            rc = 1;
            continue;
        }
        auto r = gen.value()->Lookup(ip.value(), text, "en");
        if (!r.ok())
        {
            std::cout << text << ": " << r.status().ToString() << "\n";
            rc = 1;
        }
        else if (!r.value())
            std::cout << text << ": not found\n";
        else
            std::cout << geoserve::server::LookupResultToJson(*r.value()) << "\n";
    }
    return rc;
}
