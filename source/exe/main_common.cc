#include "source/exe/main_common.h"

#include <cstdlib>
#include <iostream>
#include <memory>

#include "source/common/common/assert.h"
#include "source/common/materializer/append_materializer.h"
#include "source/common/materializer/oidc_materializer.h"
#include "source/exe/process_handoff.h"

namespace Unseal {

MainCommon::MainCommon(int argc, const char* const* argv)
    : options_(argc, argv, spdlog::level::info),
      logging_context_(options_.logLevel(), options_.logFormat()),
      materializer_(createMaterializer(options_, file_system_, time_source_)) {}

MainCommon::MainCommon(const std::vector<std::string>& args)
    : options_(args, spdlog::level::info),
      logging_context_(options_.logLevel(), options_.logFormat()),
      materializer_(createMaterializer(options_, file_system_, time_source_)) {}

Materializer::MaterializerPtr MainCommon::createMaterializer(const Server::Options& options,
                                                             Filesystem::Instance& file_system,
                                                             TimeSource& time_source) {
  switch (options.mode()) {
  case Server::Mode::Append:
    return std::make_unique<Materializer::AppendMaterializer>(
        file_system, options.secretsDirectory(), options.configFile(), options.fragmentSuffix());
  case Server::Mode::Generate:
    return std::make_unique<Materializer::OidcMaterializer>(
        file_system, time_source, options.secretsDirectory(), options.outputFile(),
        options.targetBinary());
  }
  PANIC_DUE_TO_CORRUPT_ENUM;
}

int MainCommon::run() {
  const Materializer::Invocation& invocation = options_.targetInvocation();
  const absl::Status status = materializer_->materialize(invocation);
  if (!status.ok()) {
    UNSEAL_LOG(critical, "not starting the target: {}", status.ToString());
    return EXIT_FAILURE;
  }
  return ProcessHandoff::execute(materializer_->execTarget(invocation));
}

int MainCommon::main(int argc, char** argv) {
  std::unique_ptr<MainCommon> main_common;

  // Initialize under a try/catch and simply return EXIT_FAILURE as needed. Whatever code in the
  // initialization path that fails is expected to explain itself in the exception message.
  try {
    main_common = std::make_unique<MainCommon>(argc, argv);
  } catch (const NoServingException& e) {
    return EXIT_SUCCESS;
  } catch (const MalformedArgvException& e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  } catch (const UnsealException& e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  return main_common->run();
}

} // namespace Unseal
