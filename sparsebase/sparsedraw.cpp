// This file is part of Golly.
// See docs/License.html for the copyright notice.

#include "sparsedraw.h"
#include "sparselife.h"
#include "viewport.h"
#include "liferender.h"

void drawsparselife(const sparselife &univ, const viewport &view,
                    liferender &renderer) {
   renderer.fill(0, 0, view.getpixelwidth(), view.getpixelheight(), 0) ;
   int c = view.getcellsize() ;
   // the viewport may describe a smaller grid than the universe
   int wd = view.getgridwidth() < univ.getwidth() ?
            view.getgridwidth() : univ.getwidth() ;
   int ht = view.getgridheight() < univ.getheight() ?
            view.getgridheight() : univ.getheight() ;
   int v = 0 ;
   for (int y=0; y<ht; y++) {
      for (int x=0; x<wd; x++) {
         int skip = univ.nextcell(x, y, v) ;
         if (skip < 0 || x + skip >= wd)
            break ;
         x += skip ;
         renderer.fill(x * c, y * c, c, c, 1) ;
      }
   }
   renderer.flip() ;
}
