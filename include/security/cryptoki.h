#pragma once
// Single entry point for the PKCS#11 C API.
// Uses the OASIS header shipped by p11-kit (pkg-config: p11-kit-1) in its
// default CK_* naming mode. Include this instead of the system header directly.

#include <p11-kit/pkcs11.h>
