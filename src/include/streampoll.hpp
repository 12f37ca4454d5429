#pragma once

#include "fanoutexecutor.hpp"
#include "streamaggregator.hpp"
#include "streamconnection.hpp"
#include "streampollconfig.hpp"
#include "streampolllog.hpp"
#include "streampoller.hpp"
#include "streampolltypes.hpp"
#include "streamrequest.hpp"
