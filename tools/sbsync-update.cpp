#include "config.hpp"
#include "face_fetcher.hpp"
#include "list_state.hpp"

#include <ndn-cxx/face.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <iostream>
#include <memory>
#include <utility>
#include <vector>

static void
usage(const char* programName)
{
  std::cerr << "Usage: " << programName << " <config-file> <list-name> [<delta-name>...]\n"
            << "\n"
            << "Loads every configured list, fetches the given delta names into <list-name>\n"
            << "and prints the update request line of each list.\n";
}

int
main(int argc, char** argv)
{
  if (argc < 3) {
    usage(argv[0]);
    return 1;
  }

  sbsync::Config config;
  try {
    config = sbsync::loadConfigFile(argv[1]);
  }
  catch (const sbsync::ConfigError& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }

  std::vector<std::unique_ptr<sbsync::ListState>> lists;
  sbsync::ListState* target = nullptr;
  for (const auto& name : config.lists) {
    std::unique_ptr<sbsync::ListState> list(new sbsync::ListState(name, config.getListFileName(name),
                                                                  config.bloomFalsePositive));
    if (name == argv[2]) {
      target = list.get();
    }
    lists.push_back(std::move(list));
  }

  if (target == nullptr) {
    std::cerr << "ERROR: list " << argv[2] << " is not configured in " << argv[1] << std::endl;
    return 1;
  }

  try {
    for (const auto& list : lists) {
      list->load();
    }

    for (int i = 3; i < argc; ++i) {
      target->addDeltaSource(argv[i]);
    }

    ndn::Face face;
    sbsync::FaceFetcher fetcher(face, config.interestLifetime);
    target->loadFromSources(fetcher);
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  }

  for (const auto& list : lists) {
    std::cout << list->getRequestLine() << "\n";
  }
  std::cerr << target->getName() << " last updated "
            << boost::posix_time::to_simple_string(target->getLastUpdated()) << std::endl;
  return 0;
}
