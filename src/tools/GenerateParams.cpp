#include <libstealthpool/basics/Config.h>
#include <libstealthpool/basics/Log.h>
#include <libstealthpool/pool/PoolConfig.h>
#include <libstealthpool/zkp/ZkProver.h>

#include <boost/program_options.hpp>

#include <exception>
#include <iostream>
#include <string>

namespace po = boost::program_options;

// Writes the Groth16 proving and verification keys for a pool's tree depth.
int
main(int argc, char** argv)
{
    po::options_description desc("stealthpool-generate-params options");
    // clang-format off
    desc.add_options()
        ("help,h", "show this help")
        ("conf", po::value<std::string>()->default_value("stealthpool.cfg"),
            "pool configuration file")
        ("out", po::value<std::string>(),
            "key path prefix, overrides [zkp] key_path")
        ("force", "regenerate even if keys already exist");
    // clang-format on

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (po::error const& e)
    {
        std::cerr << e.what() << "\n" << desc << "\n";
        return 2;
    }

    if (vm.count("help"))
    {
        std::cout << desc << "\n";
        return 0;
    }

    stealthpool::PoolConfig config;
    try
    {
        auto const tree =
            stealthpool::loadConfigFile(vm["conf"].as<std::string>());
        config = stealthpool::parsePoolConfig(tree);
    }
    catch (std::invalid_argument const& e)
    {
        std::cerr << "config: " << e.what() << "\n";
        return 2;
    }

    stealthpool::initLogging(config.log);
    stealthpool::Journal j("GenerateParams");

    auto const keyPath =
        vm.count("out") ? vm["out"].as<std::string>() : config.keyPath;

    stealthpool::zkp::ZkProver prover(config.pool.levels, j);
    if (!vm.count("force") && prover.loadKeys(keyPath) &&
        prover.hasProvingKey())
    {
        JLOG(j.info()) << "keys for depth " << config.pool.levels
                       << " already present at " << keyPath;
        return 0;
    }

    JLOG(j.info()) << "generating keys for depth " << config.pool.levels
                   << " (" << prover.numConstraints() << " constraints)";
    if (!prover.generateKeys(true))
    {
        JLOG(j.fatal()) << "key generation failed";
        return 1;
    }
    if (!prover.saveKeys(keyPath))
    {
        JLOG(j.fatal()) << "cannot write keys to " << keyPath;
        return 1;
    }

    JLOG(j.info()) << "wrote " << keyPath << "_pk and " << keyPath << "_vk";
    return 0;
}
