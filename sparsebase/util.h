// This file is part of Golly.
// See docs/License.html for the copyright notice.

/**
 *   Error and status reporting shared by the engine and its drivers,
 *   plus a few small helpers.
 */
#ifndef UTIL_H
#define UTIL_H
#include <cstdio> // for FILE *

/**
 *   Report through the current lifeerrors handler.  lifefatal() never
 *   returns.
 */
void lifefatal(const char *s) ;
void lifewarning(const char *s) ;
void lifestatus(const char *s) ;
/**
 *   To substitute your own routines, use the following class.
 *   fatal() must not return.  Passing 0 to seterrorhandler() puts
 *   back the default, which writes to stderr.
 */
class lifeerrors {
public:
   virtual ~lifeerrors() {}
   virtual void fatal(const char *s) = 0 ;
   virtual void warning(const char *s) = 0 ;
   virtual void status(const char *s) = 0 ;
   static void seterrorhandler(lifeerrors *obj) ;
} ;
/**
 *   Reads lines ending in LF, CR or CR LF from a FILE *.  The returned
 *   line has no terminator; lines longer than maxlen-1 come back in
 *   pieces.  If closeonfree is set the file is closed with the reader.
 */
class linereader {
public:
   linereader(FILE *f, bool closeonfree = false) ;
   ~linereader() ;
   char *fgets(char *buf, int maxlen) ;
private:
   linereader(const linereader &) ;
   linereader &operator=(const linereader &) ;
   FILE *fp ;
   int lastchar ;
   bool closeonfree ;
} ;
/**
 *   Seconds since an arbitrary point, as a double.
 */
double lifeSecondCount() ;
#endif
