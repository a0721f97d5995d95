// This file is part of Golly.
// See docs/License.html for the copyright notice.

#include "liferender.h"
#include <string.h>
liferender::~liferender() {}
void liferender::flip() {}
void staterender::fill(int x, int y, int w, int h, int state) {
   int ymin = y < 0 ? 0 : y ;
   int ymax = vh < y+h ? vh-1 : y+h-1 ;
   int xmin = x < 0 ? 0 : x ;
   int xmax = vw < x+w ? vw-1 : x+w-1 ;
   if (ymax < ymin || xmax < xmin)
      return ;
   int nb = xmax - xmin + 1 ;
   for (int yy=ymin; yy<=ymax; yy++)
      memset(buf + yy * vw + xmin, state, nb) ;
}
