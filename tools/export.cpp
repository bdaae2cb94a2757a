#include "utils/export.hpp"
#include "utils/string.hpp"

#include "cxxopts.hpp"

#include <iostream>
#include <string>
#include <vector>

int export_main(int argc, char** argv) {
  std::string input_filename, output_filename;
  utils::ExportSettings settings;
  bif6::ReaderSettings reader_settings;

  cxxopts::Options options("sims export", " <input.bif6> <output.h5>");
  options.add_options()
    ("min-mz", "skip intervals whose middle m/z is below this value",
     cxxopts::value<double>(settings.min_mz)->default_value("0"))
    ("max-mz", "skip intervals whose middle m/z is above this value",
     cxxopts::value<double>(settings.max_mz)->default_value("1e12"))
    ("remove-hotspots", "clip intensities above the 99th percentile",
     cxxopts::value<bool>(settings.remove_hotspots))
    ("max-dimension", "reject images wider or taller than this",
     cxxopts::value<uint32_t>(reader_settings.max_dimension)->default_value("8192"))
    ("help", "Print help");

  options.add_options("hidden")
    ("in", "", cxxopts::value<std::string>(input_filename))
    ("out", "", cxxopts::value<std::string>(output_filename));

  options.parse_positional(std::vector<std::string>{"in", "out"});

  options.parse(argc, argv);

  if (options.count("help") || input_filename.empty() || output_filename.empty()) {
    std::cout << options.help({""}) << std::endl;
    return 0;
  }

  if (!utils::endsWith(output_filename, ".h5") && !utils::endsWith(output_filename, ".hdf5"))
    std::cerr << "WARNING: output file " << output_filename
              << " doesn't have an HDF5 extension" << std::endl;

  settings.use_progressbar = true;

  try {
    auto n = utils::exportToHdf5(input_filename, output_filename, settings, reader_settings);
    std::cout << "wrote " << n << " intervals to " << output_filename << std::endl;
  } catch (bif6::FormatError& e) {
    std::cerr << input_filename << ": " << bif6::FormatError::kindName(e.kind())
              << ": " << e.what() << std::endl;
    return -2;
  } catch (std::runtime_error& e) {
    std::cerr << e.what() << std::endl;
    return -3;
  }

  return 0;
}
