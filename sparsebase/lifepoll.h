// This file is part of Golly.
// See docs/License.html for the copyright notice.

/**
 *   Drivers poll this between generations to find out whether a long
 *   run should stop.  A run stops when something (usually a SIGINT
 *   handler) calls setInterrupted(), or when it goes past its time
 *   limit.  The engine itself never polls; advance(n) runs to
 *   completion, so a driver that wants to stop early steps one
 *   generation at a time.
 */
#ifndef LIFEPOLL_H
#define LIFEPOLL_H
#include <signal.h>     // for sig_atomic_t
class lifepoll {
public:
   lifepoll() ;
   /**
    *   Stop the run this many seconds from now.  Zero or less removes
    *   the limit.
    */
   void settimelimit(double seconds) ;
   /**
    *   Same, as an absolute lifeSecondCount() value.
    */
   void setdeadline(double when) { deadline = when ; }
   double getdeadline() const { return deadline ; }
   /**
    *   Call this to stop the current run.  Safe to call from a signal
    *   handler.
    */
   void setInterrupted() { interrupted = 1 ; }
   void resetInterrupted() { interrupted = 0 ; timedout = 0 ; }
   int isInterrupted() const { return interrupted ; }
   // did the last stop come from the time limit?
   int isTimedOut() const { return timedout ; }
   /**
    *   Returns 1 if the run should stop.  Once it has returned 1 it
    *   keeps doing so until resetInterrupted().
    */
   int poll() ;
private:
   volatile sig_atomic_t interrupted ;
   int timedout ;
   double deadline ;
} ;
#endif
