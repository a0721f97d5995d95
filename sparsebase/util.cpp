// This file is part of Golly.
// See docs/License.html for the copyright notice.

#include "util.h"
#include <stdio.h>
#include <stdlib.h>
#include <sys/time.h>

namespace {

class stderrerrors : public lifeerrors {
public:
   virtual void fatal(const char *s) {
      fprintf(stderr, "Fatal error: %s\n", s) ;
      exit(10) ;
   }
   virtual void warning(const char *s) {
      fprintf(stderr, "Warning: %s\n", s) ;
   }
   virtual void status(const char *s) {
      fprintf(stderr, "%s\n", s) ;
   }
} ;

stderrerrors defaulterrors ;
lifeerrors *errorhandler = &defaulterrors ;

const int LF = 10 ;
const int CR = 13 ;

} // namespace

void lifeerrors::seterrorhandler(lifeerrors *o) {
   errorhandler = o ? o : &defaulterrors ;
}

void lifefatal(const char *s) {
   errorhandler->fatal(s) ;
   // a handler that returns from fatal() is a bug in the handler
   exit(10) ;
}

void lifewarning(const char *s) {
   errorhandler->warning(s) ;
}

void lifestatus(const char *s) {
   errorhandler->status(s) ;
}

linereader::linereader(FILE *f, bool closeonfreearg)
   : fp(f), lastchar(0), closeonfree(closeonfreearg) {}

linereader::~linereader() {
   if (closeonfree && fp)
      fclose(fp) ;
}

char *linereader::fgets(char *buf, int maxlen) {
   int i = 0 ;
   while (i + 1 < maxlen) {
      int c = getc(fp) ;
      if (c == EOF) {
         if (i == 0)
            return 0 ;
         break ;
      }
      int prev = lastchar ;
      lastchar = c ;
      if (c == CR)
         break ;
      if (c == LF) {
         // second half of CR LF
         if (prev == CR)
            continue ;
         break ;
      }
      buf[i++] = (char)c ;
   }
   buf[i] = 0 ;
   return buf ;
}

double lifeSecondCount() {
   struct timeval tv ;
   gettimeofday(&tv, 0) ;
   return tv.tv_sec + 0.000001 * tv.tv_usec ;
}
