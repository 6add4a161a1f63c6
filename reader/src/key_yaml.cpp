#include "key_yaml.hpp"
#include "hex.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace glog {

std::string emit_key_yaml(const ServerKey& key) {
    YAML::Emitter out;

    out << YAML::BeginDoc;
    out << YAML::BeginMap;

    out << YAML::Key << "version" << YAML::Value << key.version;
    out << YAML::Key << "type"    << YAML::Value << "glog-server-key";
    out << YAML::Key << "alias"   << YAML::Value << key.alias;
    out << YAML::Key << "curve"   << YAML::Value << key.curve;
    out << YAML::Key << "id"      << YAML::Value << key.id;
    out << YAML::Key << "pk"      << YAML::Value << hex_encode(key.pk);
    if (!key.sk.empty())
        out << YAML::Key << "sk"  << YAML::Value << hex_encode(key.sk);
    out << YAML::Key << "kdf"     << YAML::Value << kdf_name(key.kdf);
    out << YAML::Key << "cipher-continuity" << YAML::Value << continuity_name(key.continuity);

    out << YAML::EndMap;
    out << YAML::EndDoc;

    return std::string(out.c_str()) + "\n";
}

} // namespace glog
