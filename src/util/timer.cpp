
#include "util/timer.h"

double Timer::startTime = Timer::now();
