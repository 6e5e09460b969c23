#include "app/PdfCatalogApp.hpp"

int main(int argc, char** argv) {
    pdfcatalog::app::PdfCatalogApp app;
    return app.Run(argc, argv);
}
