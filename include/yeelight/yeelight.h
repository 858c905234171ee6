#pragma once

#include "yeelight/codec.h"
#include "yeelight/commands.h"
#include "yeelight/correlator.h"
#include "yeelight/discovery.h"
#include "yeelight/error.h"
#include "yeelight/flow.h"
#include "yeelight/notifications.h"
#include "yeelight/session.h"
#include "yeelight/transport.h"
