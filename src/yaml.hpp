#ifndef YAML_HPP
#define YAML_HPP

#include <yaml-cpp/yaml.h>

struct PoolConfig;
enum class COA_METHOD: uint8_t;
enum class LOGL: uint8_t;
struct CoAConf;
struct DeviceConf;
struct NASCPGlobalConf;

namespace YAML {
    template <>
    struct convert<PoolConfig>
    {
        static Node encode(const PoolConfig &rhs);
        static bool decode(const Node &node, PoolConfig &rhs);
    };

    template <>
    struct convert<COA_METHOD>
    {
        static Node encode(const COA_METHOD &rhs);
        static bool decode(const Node &node, COA_METHOD &rhs);
    };

    template <>
    struct convert<LOGL>
    {
        static Node encode(const LOGL &rhs);
        static bool decode(const Node &node, LOGL &rhs);
    };

    template <>
    struct convert<CoAConf>
    {
        static Node encode(const CoAConf &rhs);
        static bool decode(const Node &node, CoAConf &rhs);
    };

    template <>
    struct convert<DeviceConf>
    {
        static Node encode(const DeviceConf &rhs);
        static bool decode(const Node &node, DeviceConf &rhs);
    };

    template <>
    struct convert<NASCPGlobalConf>
    {
        static Node encode(const NASCPGlobalConf &rhs);
        static bool decode(const Node &node, NASCPGlobalConf &rhs);
    };
}

#endif
