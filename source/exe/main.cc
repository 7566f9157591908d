#include "source/exe/main_common.h"

// NOLINT(namespace-unseal)

/**
 * Basic Site-Specific main()
 *
 * Installed as the container entrypoint, either as unseal or under one of the wrapper names
 * oslo-secrets-wrapper and apache2-oidc-wrapper.
 */
int main(int argc, char** argv) { return Unseal::MainCommon::main(argc, argv); }
