#pragma once

// Wire messages of the claims.v1 package.
#include "claims/v1/claim_event.pb.h"
