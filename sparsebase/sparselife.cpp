// This file is part of Golly.
// See docs/License.html for the copyright notice.

#include "sparselife.h"
#include "util.h"
#include <limits.h>
#include <stdio.h>
#include <string.h>

const char *INVALIDDIMENSION = "Invalid dimension; width and height must be positive." ;
const char *GRIDTOOLARGE = "Grid is too large." ;

int sparselife::verbose ;

sparselife *sparselife::create(int wd, int ht, const char **errmsg) {
   const char *err = 0 ;
   if (wd <= 0 || ht <= 0)
      err = INVALIDDIMENSION ;
   else if (((long long)wd + 2) * ((long long)ht + 2) > INT_MAX)
      err = GRIDTOOLARGE ;
   if (errmsg)
      *errmsg = err ;
   if (err)
      return 0 ;
   return new sparselife(wd, ht) ;
}

sparselife::sparselife(int wdarg, int htarg) :
      wd(wdarg), ht(htarg), population(0), generation(0) {
   int cells = (wd + 2) * (ht + 2) ;
   live.assign(cells, 0) ;
   interior.assign(cells, 1) ;
   neighbors.assign(cells, 0) ;
   pending.assign(cells, 0) ;
   // top and bottom rows of the border
   for (int i=0; i<wd+2; i++)
      interior[i] = interior[cells-1-i] = 0 ;
   // left and right columns
   for (int j=0; j<ht; j++) {
      int k = (j + 1) * (wd + 2) ;
      interior[k] = interior[k + wd + 1] = 0 ;
   }
   int n = 0 ;
   for (int dx=-1; dx<=1; dx++)
      for (int dy=-1; dy<=1; dy++)
         if (dx || dy)
            neighborhood[n++] = dy * (wd + 2) + dx ;
}

sparselife::~sparselife() {}

void sparselife::setcell(int p, bool value) {
   if (!inbounds(p) || (live[p] != 0) == value)
      return ;
   live[p] = value ;
   population += value ? 1 : -1 ;
   markpending(p) ;
   int adjust = value ? 1 : -1 ;
   for (int i=0; i<8; i++) {
      int n = p + neighborhood[i] ;
      if (interior[n]) {
         neighbors[n] += adjust ;
         markpending(n) ;
      }
   }
}

void sparselife::advance(int steps) {
   for (int s=0; s<steps; s++) {
      // Take every queued cell with the state and count it had at the
      // end of the last generation, and empty the queue, before any
      // cell changes.  The setcell calls below queue cells for the
      // *next* generation.
      snapshot.resize(needsupdate.size()) ;
      for (unsigned int i=0; i<needsupdate.size(); i++) {
         int p = needsupdate[i] ;
         snapshot[i].p = p ;
         snapshot[i].wasalive = live[p] != 0 ;
         snapshot[i].count = neighbors[p] ;
         pending[p] = 0 ;
      }
      needsupdate.clear() ;
      for (unsigned int i=0; i<snapshot.size(); i++) {
         const updateentry &e = snapshot[i] ;
         if (e.wasalive) {
            if (e.count < 2 || e.count > 3)
               setcell(e.p, false) ;
         } else if (e.count == 3) {
            setcell(e.p, true) ;
         }
      }
      generation++ ;
   }
   if (verbose && steps > 0) {
      char msg[128] ;
      sprintf(msg, "Generation %lld: population %d, %d cells pending",
              generation, population, (int)needsupdate.size()) ;
      lifestatus(msg) ;
   }
}

static bool iswhite(char c) {
   return c == ' ' || c == '\t' || c == '\r' || c == '\n' ||
          c == '\v' || c == '\f' ;
}

void sparselife::paste(const char *s, int x, int y, char livechar) {
   const char *end = s + strlen(s) ;
   while (s < end && iswhite(*s))
      s++ ;
   while (end > s && iswhite(end[-1]))
      end-- ;
   int row = 0 ;
   while (s < end) {
      const char *eol = (const char *)memchr(s, '\n', end - s) ;
      if (eol == 0)
         eol = end ;
      const char *a = s ;
      const char *b = eol ;
      while (a < b && iswhite(*a))
         a++ ;
      while (b > a && iswhite(b[-1]))
         b-- ;
      // clip here rather than in setcell: cell() wraps an x just past
      // the right edge onto the next row
      long long cy = (long long)y + row ;
      if (cy >= 0 && cy < ht) {
         for (int col=0; a+col<b; col++) {
            long long cx = (long long)x + col ;
            if (cx >= 0 && cx < wd)
               setcell(cell((int)cx, (int)cy), a[col] == livechar) ;
         }
      }
      row++ ;
      s = eol + 1 ;
   }
}

void sparselife::clearall() {
   for (int p=0; p<(int)live.size(); p++)
      if (live[p])
         setcell(p, false) ;
   for (unsigned int i=0; i<needsupdate.size(); i++)
      pending[needsupdate[i]] = 0 ;
   needsupdate.clear() ;
   generation = 0 ;
}

int sparselife::nextcell(int x, int y, int &v) const {
   if (y < 0 || y >= ht || x >= wd)
      return -1 ;
   int start = x ;
   if (x < 0)
      x = 0 ;
   for (int p = cell(x, y); x < wd; x++, p++)
      if (live[p]) {
         v = 1 ;
         return x - start ;
      }
   return -1 ;
}

bool sparselife::findedges(int *t, int *l, int *b, int *r) const {
   if (population == 0)
      return false ;
   int top = ht, left = wd, bottom = -1, right = -1 ;
   for (int y=0; y<ht; y++) {
      int p = cell(0, y) ;
      for (int x=0; x<wd; x++, p++) {
         if (live[p]) {
            if (y < top) top = y ;
            if (y > bottom) bottom = y ;
            if (x < left) left = x ;
            if (x > right) right = x ;
         }
      }
   }
   *t = top ;
   *l = left ;
   *b = bottom ;
   *r = right ;
   return true ;
}
