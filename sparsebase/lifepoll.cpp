// This file is part of Golly.
// See docs/License.html for the copyright notice.

#include "lifepoll.h"
#include "util.h"

lifepoll::lifepoll() : interrupted(0), timedout(0), deadline(0) {}

void lifepoll::settimelimit(double seconds) {
   deadline = (seconds > 0) ? lifeSecondCount() + seconds : 0 ;
}

int lifepoll::poll() {
   if (interrupted)
      return 1 ;
   if (deadline > 0 && lifeSecondCount() > deadline) {
      timedout = 1 ;
      interrupted = 1 ;
   }
   return interrupted ;
}
