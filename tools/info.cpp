#include "bif6/reader.hpp"

#include "cxxopts.hpp"

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

int info_main(int argc, char** argv) {
  std::string input_filename;
  bif6::ReaderSettings settings;

  cxxopts::Options options("sims info", " <input.bif6>");
  options.add_options()
    ("max-dimension", "reject images wider or taller than this",
     cxxopts::value<uint32_t>(settings.max_dimension)->default_value("8192"))
    ("help", "Print help");

  options.add_options("hidden")
    ("in", "", cxxopts::value<std::string>(input_filename));

  options.parse_positional(std::vector<std::string>{"in"});

  options.parse(argc, argv);

  if (options.count("help") || input_filename.empty()) {
    std::cout << options.help({""}) << std::endl;
    return 0;
  }

  try {
    bif6::Bif6Reader reader(input_filename, settings);
    std::cout << input_filename << ": " << reader.intervalCount() << " intervals, "
              << reader.width() << "x" << reader.height() << " pixels\n";

    const auto sep = "\t";
    std::cout << "id" << sep << "mz_lower" << sep << "mz_middle" << sep << "mz_upper"
              << sep << "total" << sep << "max\n";

    sims::IntervalImage interval;
    while (reader.readNext(interval)) {
      std::cout << interval.id << sep << std::fixed << std::setprecision(4)
                << interval.mz_lower << sep << interval.mz_middle << sep
                << interval.mz_upper << sep << interval.totalCounts() << sep
                << interval.maxIntensity() << (interval.isTicImage() ? " (TIC)" : "")
                << "\n";
    }

    if (reader.recordsRead() != reader.intervalCount())
      std::cerr << "WARNING: header announces " << reader.intervalCount()
                << " intervals, file contains " << reader.recordsRead() << std::endl;
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
