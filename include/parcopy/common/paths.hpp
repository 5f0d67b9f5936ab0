#pragma once

#include <string>
#include <vector>

namespace parcopy {
namespace common {

class PathManager {
public:
    static PathManager& instance();
    
    std::string getUserConfigDir() const;
    std::string getUserConfigFile() const;
    std::string getSystemConfigFile() const;
    
    std::vector<std::string> getConfigSearchPaths() const;

private:
    PathManager() = default;
    
    std::string getXdgConfigHome() const;
};

}}
