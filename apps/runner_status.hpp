#pragma once

#include <string>

int status_command(const std::string &config_path, const std::string &output_dir_override);
