#include "config.hpp"
#include "errors.hpp"
#include "escpos.hpp"
#include "logger.hpp"
#include "quantizer.hpp"
#include "receipts.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

// Python bytes <-> command buffers
static pybind11::bytes
to_bytes( const CommandBuffer& buf )
{
  return pybind11::bytes( std::string( buf.begin(), buf.end() ) );
}


PYBIND11_MODULE( rawthermal, m )
{
  m.doc() = "Raw ESC/POS command generation for thermal receipt printers";

  pybind11::register_exception<input_error>( m, "InputError", PyExc_ValueError );
  pybind11::register_exception<render_error>( m, "RenderError" );
  pybind11::register_exception<persistence_error>( m, "PersistenceError" );

  pybind11::enum_<LogLevel>( m, "LogLevel" )
  .value( "DEBUG",   LogLevel::DEBUG   )
  .value( "INFO",    LogLevel::INFO    )
  .value( "WARNING", LogLevel::WARNING )
  .value( "ERROR",   LogLevel::ERROR   )
  ;
  m.def( "set_log_level",          &set_log_level          );
  m.def( "set_logging_descriptor", &set_logging_descriptor );
  m.def( "get_log_level",          &get_log_level          );

  pybind11::enum_<Alignment>( m, "Alignment" )
  .value( "LEFT",   Alignment::LEFT   )
  .value( "CENTER", Alignment::CENTER )
  .value( "RIGHT",  Alignment::RIGHT  )
  ;

  pybind11::enum_<FontSize>( m, "FontSize" )
  .value( "NORMAL",        FontSize::NORMAL        )
  .value( "DOUBLE_HEIGHT", FontSize::DOUBLE_HEIGHT )
  .value( "DOUBLE_WIDTH",  FontSize::DOUBLE_WIDTH  )
  .value( "DOUBLE",        FontSize::DOUBLE        )
  ;

  pybind11::enum_<CutMode>( m, "CutMode" )
  .value( "FULL",    CutMode::FULL    )
  .value( "PARTIAL", CutMode::PARTIAL )
  ;

  pybind11::enum_<TextEncoding>( m, "TextEncoding" )
  .value( "UTF8",   TextEncoding::UTF8   )
  .value( "GB2312", TextEncoding::GB2312 )
  .value( "CP437",  TextEncoding::CP437  )
  ;

  // Chainable methods return the encoder itself
  const auto self = pybind11::return_value_policy::reference_internal;
  pybind11::class_<EscPosEncoder>( m, "EscPosEncoder" )
  .def( pybind11::init<>() )
  .def( pybind11::init<TextEncoding>() )
  .def( "initialize",      &EscPosEncoder::Initialize,     self )
  .def( "align",           &EscPosEncoder::Align,          self )
  .def( "bold",            &EscPosEncoder::Bold,           self )
  .def( "underline",       &EscPosEncoder::Underline,      self )
  .def( "font_size",       &EscPosEncoder::SetFontSize,    self )
  .def( "text",            &EscPosEncoder::Text,           self )
  .def( "line",            &EscPosEncoder::Line,           self )
  .def( "newline",         &EscPosEncoder::Newline,        self )
  .def( "feed",            &EscPosEncoder::Feed,           self )
  .def( "cut",             &EscPosEncoder::Cut,            self,
        pybind11::arg( "mode" ) = CutMode::FULL )
  .def( "raster",          &EscPosEncoder::Raster,         self )
  .def( "barcode", []( EscPosEncoder& enc, const std::string& content,
                       const std::string& type, const int height ) -> EscPosEncoder& {
    return enc.Barcode( content, parse_symbology( type ), height );
  }, self, pybind11::arg( "content" ), pybind11::arg( "type" ) = "CODE128",
     pybind11::arg( "height" ) = 80 )
  .def( "qrcode",          &EscPosEncoder::QRCode,         self,
        pybind11::arg( "content" ), pybind11::arg( "size" ) = 6 )
  .def( "open_drawer",     &EscPosEncoder::OpenDrawer,     self,
        pybind11::arg( "pin" ) = 0 )
  .def( "beep",            &EscPosEncoder::Beep,           self,
        pybind11::arg( "times" ) = 1, pybind11::arg( "duration_ms" ) = 100 )
  .def( "density",         &EscPosEncoder::SetDensity,     self )
  .def( "horizontal_rule", &EscPosEncoder::HorizontalRule, self,
        pybind11::arg( "ch" ) = '-', pybind11::arg( "width" ) = 32 )
  .def( "key_value",       &EscPosEncoder::KeyValue,       self,
        pybind11::arg( "key" ), pybind11::arg( "value" ),
        pybind11::arg( "width" ) = 32 )
  .def( "header",          &EscPosEncoder::Header,         self,
        pybind11::arg( "title" ), pybind11::arg( "subtitle" ) = "" )
  .def( "clear",           &EscPosEncoder::Clear,          self )
  .def( "encode", []( const EscPosEncoder& enc ){
    return to_bytes( enc.Encode() );
  } )
  .def( "__len__",         &EscPosEncoder::Size )
  .def_property( "encoding", &EscPosEncoder::Encoding, &EscPosEncoder::SetEncoding )
  ;

  pybind11::class_<PixelBuffer>( m, "PixelBuffer" )
  .def( pybind11::init<unsigned, unsigned>() )
  .def( "set_pixel", &PixelBuffer::SetPixel,
        pybind11::arg( "x" ), pybind11::arg( "y" ),
        pybind11::arg( "r" ), pybind11::arg( "g" ), pybind11::arg( "b" ),
        pybind11::arg( "a" ) = 0xFF )
  .def_readonly( "width",  &PixelBuffer::width  )
  .def_readonly( "height", &PixelBuffer::height )
  ;

  pybind11::class_<ThermalRaster>( m, "ThermalRaster" )
  .def_readonly( "width",  &ThermalRaster::width  )
  .def_readonly( "height", &ThermalRaster::height )
  .def( "width_bytes", &ThermalRaster::WidthBytes )
  .def( "dot",         &ThermalRaster::Dot        )
  .def( "data", []( const ThermalRaster& r ){
    return to_bytes( r.data );
  } )
  ;
  m.def( "quantize", &Quantize );

  // Configuration
  pybind11::class_<SavedPrinter>( m, "SavedPrinter" )
  .def( pybind11::init<>() )
  .def_readwrite( "id",                  &SavedPrinter::id                  )
  .def_readwrite( "name",                &SavedPrinter::name                )
  .def_readwrite( "type",                &SavedPrinter::type                )
  .def_readwrite( "address",             &SavedPrinter::address             )
  .def_readwrite( "paper_width",         &SavedPrinter::paper_width         )
  .def_readwrite( "service_uuid",        &SavedPrinter::service_uuid        )
  .def_readwrite( "characteristic_uuid", &SavedPrinter::characteristic_uuid )
  ;

  pybind11::class_<ConfigSnapshot>( m, "ConfigSnapshot" )
  .def( pybind11::init<>() )
  .def( "paper_width", &ConfigSnapshot::PaperWidth )
  .def( "paper_dots",  &ConfigSnapshot::PaperDots  )
  .def( "line_width",  &ConfigSnapshot::LineWidth  )
  ;

  pybind11::class_<PrinterConfig>( m, "PrinterConfig" )
  .def( pybind11::init<>() )
  .def( pybind11::init<const std::string&>() )
  .def( "load",                &PrinterConfig::Load                )
  .def( "save",                &PrinterConfig::Save                )
  .def( "snapshot",            &PrinterConfig::Snapshot            )
  .def( "printers",            &PrinterConfig::Printers            )
  .def( "save_printer",        &PrinterConfig::SavePrinter         )
  .def( "remove_printer",      &PrinterConfig::RemovePrinter       )
  .def( "set_current_printer", &PrinterConfig::SetCurrentPrinter   )
  .def( "current_printer_id",  &PrinterConfig::CurrentPrinterId    )
  .def( "spool_dir",           &PrinterConfig::SpoolDir            )
  ;

  // Job templates
  pybind11::class_<TextStyle>( m, "TextStyle" )
  .def( pybind11::init<>() )
  .def_readwrite( "align",       &TextStyle::align       )
  .def_readwrite( "bold",        &TextStyle::bold        )
  .def_readwrite( "underline",   &TextStyle::underline   )
  .def_readwrite( "double_size", &TextStyle::double_size )
  ;

  m.def( "text_job", []( const std::string& text, const TextStyle& style,
                         const ConfigSnapshot& cfg ){
    return to_bytes( MakeTextJob( text, style, cfg ) );
  } );
  m.def( "test_page", []( const ConfigSnapshot& cfg ){
    return to_bytes( MakeTestPage( cfg, local_timestamp() ) );
  } );
  m.def( "qr_job", []( const std::string& content, const int size,
                       const ConfigSnapshot& cfg ){
    return to_bytes( MakeQRJob( content, size, cfg ) );
  } );
  m.def( "barcode_job", []( const std::string& content, const std::string& type,
                            const ConfigSnapshot& cfg ){
    return to_bytes( MakeBarcodeJob( content, parse_symbology( type ), cfg ) );
  } );
}
